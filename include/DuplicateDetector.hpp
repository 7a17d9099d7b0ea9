#pragma once
#include "FileSystemScanner.hpp"
#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <utility>

namespace drivesage {

// (file name, size in bytes). A cheap identity heuristic, not a content hash.
using Fingerprint = std::pair<std::string, std::int64_t>;

/**
 * DuplicateDetector walks a tree depth-first in name order and reports every
 * file whose fingerprint was already seen. The first path seen for a
 * fingerprint stays the original for the rest of the walk.
 */
class DuplicateDetector {
public:
  explicit DuplicateDetector(bool followSymlinks = false);

  // A relative rootPath is resolved against the current directory.
  DuplicateScanResult scan(const std::string &rootPath);
  DuplicateScanResult scan(const FileSystemScanner &scanner);

private:
  bool m_followSymlinks;

  void scanForDuplicates(const FileSystemScanner &scanner,
                         const std::filesystem::path &dirPath,
                         std::map<Fingerprint, std::string> &index,
                         std::set<std::string> &visited,
                         DuplicateScanResult &result);
};

} // namespace drivesage
