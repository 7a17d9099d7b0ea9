#include "FileSystemScanner.hpp"
#include <algorithm>
#include <chrono>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace drivesage {

FileSystemScanner::FileSystemScanner(std::string rootPath, bool followSymlinks)
    : m_rootPath(std::move(rootPath)), m_followSymlinks(followSymlinks) {}

FileSystemScanner::~FileSystemScanner() = default;

std::string
FileSystemScanner::normalizePathSeparators(const std::string &path) const {
  std::string result = path;
#ifdef _WIN32
  std::replace(result.begin(), result.end(), '\\', '/');
#endif
  return result;
}

std::string FileSystemScanner::toRelativePath(const fs::path &absPath) const {
  auto relativePath = absPath.lexically_relative(fs::path{m_rootPath});
  if (relativePath.empty() || relativePath == ".")
    return "";
  return normalizePathSeparators(relativePath.generic_string());
}

fs::path FileSystemScanner::resolveRoot(const std::string &rootPath) {
  auto resolved = fs::absolute(rootPath).lexically_normal();
  // "/a/b/" -> "/a/b"
  if (!resolved.has_filename() && resolved.has_relative_path())
    resolved = resolved.parent_path();
  return resolved;
}

std::int64_t FileSystemScanner::getUnixTimeStamp(const fs::file_time_type &ftime) {
  auto now_file = fs::file_time_type::clock::now();
  auto now_sys = std::chrono::system_clock::now();
  auto file_duration = ftime - now_file;
  auto sys_time =
      now_sys + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                    file_duration);
  return std::chrono::duration_cast<std::chrono::seconds>(
             sys_time.time_since_epoch())
      .count();
}

std::vector<fs::path>
FileSystemScanner::listDirectory(const fs::path &dirPath) const {
  std::vector<fs::path> children;
  for (const auto &entry : fs::directory_iterator(dirPath))
    children.push_back(entry.path());

  std::sort(children.begin(), children.end(),
            [](const fs::path &a, const fs::path &b) {
              return a.filename().string() < b.filename().string();
            });
  return children;
}

EntryStat FileSystemScanner::statEntry(const fs::path &path) const {
  EntryStat entry;
  entry.path = path;
  entry.name = path.filename().string();

  // fs::status() reports a dangling link as not_found instead of failing
  auto status = fs::status(path);
  if (!fs::exists(status)) {
    throw fs::filesystem_error(
        "cannot stat entry", path,
        std::make_error_code(std::errc::no_such_file_or_directory));
  }

  entry.modified = getUnixTimeStamp(fs::last_write_time(path));
  if (fs::is_directory(status)) {
    entry.kind = fs::is_symlink(fs::symlink_status(path))
                     ? EntryKind::LinkedDirectory
                     : EntryKind::Directory;
  } else {
    entry.kind = EntryKind::File;
    if (fs::is_regular_file(status))
      entry.size = static_cast<std::int64_t>(fs::file_size(path));
  }
  return entry;
}

bool FileSystemScanner::isTraversable(const EntryStat &entry) const {
  switch (entry.kind) {
  case EntryKind::Directory:
    return true;
  case EntryKind::LinkedDirectory:
    return m_followSymlinks;
  case EntryKind::File:
    return false;
  }
  return false;
}

FolderProfile FileSystemScanner::profileFolder(const fs::path &dirPath) const {
  return profileFolder(dirPath, listDirectory(dirPath));
}

FolderProfile
FileSystemScanner::profileFolder(const fs::path &dirPath,
                                 const std::vector<fs::path> &children) const {
  FolderProfile profile;
  profile.name = dirPath.filename().string();
  profile.path = dirPath.string();
  profile.relativePath = toRelativePath(dirPath);

  // Any failing child fails the whole profile
  for (const auto &child : children) {
    EntryStat entry = statEntry(child);
    if (entry.kind != EntryKind::File) {
      if (isTraversable(entry))
        profile.subfolders.push_back(entry.name);
      continue;
    }

    profile.fileCount++;
    profile.size += entry.size;
    profile.looseFiles.push_back({entry.name, entry.size, entry.modified});
    if (!profile.lastModified || entry.modified > *profile.lastModified)
      profile.lastModified = entry.modified;
  }
  return profile;
}

} // namespace drivesage
