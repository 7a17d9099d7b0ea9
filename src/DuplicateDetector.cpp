#include "DuplicateDetector.hpp"
#include <iostream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace drivesage {

DuplicateDetector::DuplicateDetector(bool followSymlinks)
    : m_followSymlinks(followSymlinks) {}

DuplicateScanResult DuplicateDetector::scan(const std::string &rootPath) {
  fs::path root;
  try {
    root = FileSystemScanner::resolveRoot(rootPath);
  } catch (const fs::filesystem_error &e) {
    std::cerr << "[Duplicates] Cannot resolve root: " << rootPath << " - "
              << e.what() << std::endl;
    DuplicateScanResult result;
    result.errors.push_back({rootPath, e.what()});
    return result;
  }
  FileSystemScanner scanner(root.string(), m_followSymlinks);
  return scan(scanner);
}

DuplicateScanResult DuplicateDetector::scan(const FileSystemScanner &scanner) {
  std::cout << "[Duplicates] Starting duplicate detection: "
            << scanner.rootPath() << std::endl;
  DuplicateScanResult result;
  std::map<Fingerprint, std::string> index;
  std::set<std::string> visited;

  const fs::path root{scanner.rootPath()};
  std::error_code ec;
  auto canonicalRoot = fs::weakly_canonical(root, ec);
  if (!ec)
    visited.insert(canonicalRoot.string());

  scanForDuplicates(scanner, root, index, visited, result);

  std::cout << "[Duplicates] Duplicate detection completed. Found "
            << result.duplicates.size() << " duplicates" << std::endl;
  return result;
}

void DuplicateDetector::scanForDuplicates(
    const FileSystemScanner &scanner, const fs::path &dirPath,
    std::map<Fingerprint, std::string> &index, std::set<std::string> &visited,
    DuplicateScanResult &result) {
  std::vector<fs::path> children;
  try {
    children = scanner.listDirectory(dirPath);
  } catch (const fs::filesystem_error &e) {
    std::cerr << "[Duplicates] Error scanning directory: " << dirPath << " - "
              << e.what() << std::endl;
    result.errors.push_back({dirPath.string(), e.what()});
    return;
  }

  for (const auto &child : children) {
    EntryStat entry;
    try {
      entry = scanner.statEntry(child);
    } catch (const fs::filesystem_error &e) {
      std::cerr << "[Duplicates] Error processing item: " << child << " - "
                << e.what() << std::endl;
      result.errors.push_back({child.string(), e.what()});
      continue;
    }

    if (entry.kind != EntryKind::File) {
      if (!scanner.isTraversable(entry))
        continue;
      if (scanner.followSymlinks()) {
        std::error_code ec;
        auto canonical = fs::canonical(child, ec);
        if (ec) {
          result.errors.push_back({child.string(), ec.message()});
          continue;
        }
        if (!visited.insert(canonical.string()).second)
          continue;
      }
      scanForDuplicates(scanner, child, index, visited, result);
      continue;
    }

    Fingerprint key{entry.name, entry.size};
    auto found = index.find(key);
    if (found == index.end()) {
      index.emplace(std::move(key), child.string());
      continue;
    }

    DuplicateRecord record;
    record.original = found->second;
    record.duplicate = child.string();
    record.relativePath = scanner.toRelativePath(child);
    record.size = entry.size;
    record.modified = entry.modified;
    result.duplicates.push_back(std::move(record));
  }
}

} // namespace drivesage
