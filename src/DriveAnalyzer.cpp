#include "DriveAnalyzer.hpp"
#include "ContentVerifier.hpp"
#include "DuplicateDetector.hpp"
#include "EntryClassifier.hpp"
#include <chrono>
#include <iostream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace drivesage {

DriveAnalyzer::DriveAnalyzer(Settings settings)
    : m_settings(std::move(settings)) {}

AnalysisReport DriveAnalyzer::analyze(const std::string &drivePath) {
  std::cout << "[Analyzer] Starting drive analysis: " << drivePath << std::endl;

  std::error_code ec;
  bool exists = fs::exists(drivePath, ec);
  if (ec) {
    std::cerr << "[Analyzer] Cannot access drive path: " << drivePath << " - "
              << ec.message() << std::endl;
    throw AnalysisError(AnalysisErrorKind::ReadError,
                        "read error: " + drivePath + ": " + ec.message());
  }
  if (!exists) {
    std::cerr << "[Analyzer] Drive path does not exist: " << drivePath
              << std::endl;
    throw AnalysisError(AnalysisErrorKind::PathNotFound,
                        "path does not exist: " + drivePath);
  }
  if (!fs::is_directory(drivePath, ec)) {
    throw AnalysisError(AnalysisErrorKind::ReadError,
                        "read error: not a directory: " + drivePath);
  }

  fs::path root;
  try {
    root = FileSystemScanner::resolveRoot(drivePath);
  } catch (const fs::filesystem_error &e) {
    throw AnalysisError(AnalysisErrorKind::ReadError,
                        std::string("read error: ") + e.what());
  }

  FileSystemScanner scanner(root.string(), m_settings.followSymlinks);
  return analyze(scanner);
}

AnalysisReport DriveAnalyzer::analyze(const FileSystemScanner &scanner) {
  const fs::path root{scanner.rootPath()};

  AnalysisReport report;
  report.drivePath = scanner.rootPath();
  report.scanTime = std::chrono::duration_cast<std::chrono::seconds>(
                        std::chrono::system_clock::now().time_since_epoch())
                        .count();

  std::vector<fs::path> children;
  try {
    children = scanner.listDirectory(root);
  } catch (const fs::filesystem_error &e) {
    std::cerr << "[Analyzer] Error scanning directory: " << root << " - "
              << e.what() << std::endl;
    throw AnalysisError(AnalysisErrorKind::ReadError,
                        std::string("read error: ") + e.what());
  }

  std::set<std::string> visited;
  std::error_code ec;
  auto canonicalRoot = fs::weakly_canonical(root, ec);
  if (!ec)
    visited.insert(canonicalRoot.string());
  scanDirectory(scanner, children, visited, report);

  DuplicateDetector detector(scanner.followSymlinks());
  DuplicateScanResult duplicates = detector.scan(scanner);
  report.duplicates = std::move(duplicates.duplicates);
  if (m_settings.verifyDuplicateContent) {
    ContentVerifier verifier;
    report.duplicates = verifier.verify(report.duplicates);
  }

  std::cout << "[Analyzer] Drive analysis completed: " << report.fileCount
            << " files, " << report.folderCount << " folders, "
            << report.totalSize << " bytes, " << report.duplicates.size()
            << " duplicates, " << report.errors.size() << " errors"
            << std::endl;
  return report;
}

void DriveAnalyzer::scanDirectory(const FileSystemScanner &scanner,
                                  const std::vector<fs::path> &children,
                                  std::set<std::string> &visited,
                                  AnalysisReport &report) {
  for (const auto &child : children) {
    EntryStat entry;
    try {
      entry = scanner.statEntry(child);
    } catch (const fs::filesystem_error &e) {
      recordError(child, e.what(), report);
      continue;
    }

    if (entry.kind == EntryKind::File) {
      classifyFile(scanner, entry, report);
      continue;
    }

    if (!scanner.isTraversable(entry)) {
      std::cout << "[Analyzer] Skipping linked directory: " << child
                << std::endl;
      continue;
    }
    if (scanner.followSymlinks()) {
      std::error_code ec;
      auto canonical = fs::canonical(child, ec);
      if (ec) {
        recordError(child, ec.message(), report);
        continue;
      }
      if (!visited.insert(canonical.string()).second) {
        std::cout << "[Analyzer] Skipping already visited directory: "
                  << child << std::endl;
        continue;
      }
    }

    // One listing per directory feeds both its profile and the recursion.
    std::vector<fs::path> grandChildren;
    try {
      grandChildren = scanner.listDirectory(child);
    } catch (const fs::filesystem_error &e) {
      recordError(child, e.what(), report);
      continue;
    }

    report.folderCount++;
    try {
      report.folders.push_back(scanner.profileFolder(child, grandChildren));
    } catch (const fs::filesystem_error &e) {
      recordError(child, std::string("folder profile failed: ") + e.what(),
                  report);
    }
    scanDirectory(scanner, grandChildren, visited, report);
  }
}

void DriveAnalyzer::classifyFile(const FileSystemScanner &scanner,
                                 const EntryStat &entry,
                                 AnalysisReport &report) {
  report.fileCount++;
  report.totalSize += entry.size;

  FileRecord record;
  record.name = entry.name;
  record.path = entry.path.string();
  record.relativePath = scanner.toRelativePath(entry.path);
  record.size = entry.size;
  record.modified = entry.modified;

  if (isLargeFile(entry.size, m_settings.largeFileThreshold))
    report.largeFiles.push_back(record);
  if (isSystemFile(entry.name))
    report.systemFiles.push_back(record);
  if (auto pattern =
          matchProtectedPattern(entry.name, m_settings.protectedPatterns)) {
    record.reason = "name contains protected pattern \"" + *pattern + "\"";
    report.protectedFiles.push_back(std::move(record));
  }
}

void DriveAnalyzer::recordError(const fs::path &path,
                                const std::string &message,
                                AnalysisReport &report) {
  std::cerr << "[Analyzer] Error processing item: " << path << " - "
            << message << std::endl;
  report.errors.push_back({path.string(), message});
}

} // namespace drivesage
