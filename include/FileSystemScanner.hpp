#ifndef DRIVESAGE_FILESYSTEMSCANNER_HPP
#define DRIVESAGE_FILESYSTEMSCANNER_HPP

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace drivesage {

enum class EntryKind { File, Directory, LinkedDirectory };

struct EntryStat {
  std::filesystem::path path;
  std::string name;
  EntryKind kind = EntryKind::File;
  std::int64_t size = 0;
  std::int64_t modified = 0;
};

/**
 * FileSystemScanner performs the single-level I/O of a scan: listing one
 * directory, stat'ing its children and building the FolderProfile of that
 * directory. Recursion is left to the callers.
 *
 * All methods throw std::filesystem::filesystem_error on I/O failure.
 */
class FileSystemScanner {
public:
  FileSystemScanner(std::string rootPath, bool followSymlinks = false);
  virtual ~FileSystemScanner();

  // Children sorted by file name so that traversal order is reproducible.
  virtual std::vector<std::filesystem::path>
  listDirectory(const std::filesystem::path &dirPath) const;

  EntryStat statEntry(const std::filesystem::path &path) const;

  // Whether a walker should descend into the entry.
  bool isTraversable(const EntryStat &entry) const;

  FolderProfile profileFolder(const std::filesystem::path &dirPath) const;
  FolderProfile
  profileFolder(const std::filesystem::path &dirPath,
                const std::vector<std::filesystem::path> &children) const;

  std::string toRelativePath(const std::filesystem::path &absPath) const;
  const std::string &rootPath() const { return m_rootPath; }
  bool followSymlinks() const { return m_followSymlinks; }

  // Absolute, lexically normalized form of a scan root ("." -> "/cwd").
  static std::filesystem::path resolveRoot(const std::string &rootPath);

  static std::int64_t
  getUnixTimeStamp(const std::filesystem::file_time_type &ftime);

private:
  std::string m_rootPath;
  bool m_followSymlinks;
  std::string normalizePathSeparators(const std::string &path) const;
};

} // namespace drivesage

#endif // DRIVESAGE_FILESYSTEMSCANNER_HPP
