#pragma once
#include "FileSystemScanner.hpp"
#include "types.hpp"
#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace drivesage {

enum class AnalysisErrorKind { PathNotFound, ReadError };

class AnalysisError : public std::runtime_error {
public:
  AnalysisError(AnalysisErrorKind kind, const std::string &message)
      : std::runtime_error(message), m_kind(kind) {}

  AnalysisErrorKind kind() const { return m_kind; }

private:
  AnalysisErrorKind m_kind;
};

/**
 * DriveAnalyzer walks a whole tree depth-first (pre-order), profiles every
 * directory below the root, classifies every file and runs duplicate
 * detection over the same tree.
 *
 * Only a missing or unreadable root is fatal. Every other failure is
 * recorded in AnalysisReport::errors and the walk continues.
 */
class DriveAnalyzer {
public:
  explicit DriveAnalyzer(Settings settings);

  // Throws AnalysisError. A relative drivePath is resolved against the
  // current directory, so every path in the report is absolute.
  AnalysisReport analyze(const std::string &drivePath);

  // Walks the tree the scanner is rooted at. Its root must be an existing
  // absolute directory.
  AnalysisReport analyze(const FileSystemScanner &scanner);

private:
  Settings m_settings;

  void scanDirectory(const FileSystemScanner &scanner,
                     const std::vector<std::filesystem::path> &children,
                     std::set<std::string> &visited, AnalysisReport &report);
  void classifyFile(const FileSystemScanner &scanner, const EntryStat &entry,
                    AnalysisReport &report);
  void recordError(const std::filesystem::path &path,
                   const std::string &message, AnalysisReport &report);
};

} // namespace drivesage
