#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace drivesage {

// 100 MiB
constexpr std::int64_t kLargeFileThreshold = 100LL * 1024 * 1024;

struct Settings {
  bool dryRun = true;
  std::vector<std::string> protectedPatterns{"gemini", "ai", "assistant",
                                             "code", "project"};
  std::int64_t largeFileThreshold = kLargeFileThreshold;
  bool followSymlinks = false;
  bool verifyDuplicateContent = false;
  std::string databasePath = "drivesage.db";
};

struct LooseFile {
  std::string name;
  std::int64_t size = 0;
  std::int64_t modified = 0; // UTC timestamp
};

struct FolderProfile {
  std::string name;
  std::string path;         // Absolute path
  std::string relativePath; // Relative to the scan root (e.g. "foo/bar")
  std::int64_t size = 0;    // Immediate files only
  std::int64_t fileCount = 0;
  std::vector<std::string> subfolders;
  std::vector<LooseFile> looseFiles;
  std::optional<std::int64_t> lastModified;
};

struct FileRecord {
  std::string name;
  std::string path;
  std::string relativePath;
  std::int64_t size = 0;
  std::int64_t modified = 0;
  std::optional<std::string> reason; // Protected files only
};

struct DuplicateRecord {
  std::string original;
  std::string duplicate;
  std::string relativePath;
  std::int64_t size = 0;
  std::int64_t modified = 0;
};

struct ScanError {
  std::string path;
  std::string message;
};

struct AnalysisReport {
  std::string drivePath;
  std::int64_t scanTime = 0;
  std::int64_t totalSize = 0;
  std::int64_t fileCount = 0;
  std::int64_t folderCount = 0;
  std::vector<FolderProfile> folders;
  std::vector<FileRecord> largeFiles;
  std::vector<FileRecord> systemFiles;
  std::vector<FileRecord> protectedFiles;
  std::vector<DuplicateRecord> duplicates;
  std::vector<ScanError> errors;
};

struct DuplicateScanResult {
  std::vector<DuplicateRecord> duplicates;
  std::vector<ScanError> errors;
};

struct MoveOperation {
  std::string source;
  std::string destination;
};

struct DeleteOperation {
  std::string path;
};

struct RenameOperation {
  std::string oldPath;
  std::string newPath;
};

using Operation = std::variant<MoveOperation, DeleteOperation, RenameOperation>;

// One entry of a plan received from outside the core. `operation` is empty
// when the entry could not be mapped onto a supported operation, `error`
// then says why.
struct PlanEntry {
  std::string type;
  std::string path;
  std::optional<Operation> operation;
  std::string error;
};

struct OperationError {
  std::string operation;
  std::string path;
  std::string message;
};

// One executed operation, successful or not.
struct OperationOutcome {
  std::string operation;
  std::string source;
  std::string destination; // Empty for deletes
  bool success = false;
  std::string message;
};

struct OperationSummary {
  std::size_t total = 0;
  std::size_t successful = 0;
  std::size_t failed = 0;
};

struct OperationResult {
  std::vector<MoveOperation> moved;
  std::vector<std::string> deleted;
  std::vector<RenameOperation> renamed;
  std::vector<OperationError> errors;
  std::vector<OperationOutcome> outcomes; // Execution order
  OperationSummary summary;
};

struct ScanHistoryEntry {
  int id = 0;
  std::string drivePath;
  std::int64_t scannedAt = 0;
  std::int64_t totalSize = 0;
  std::int64_t fileCount = 0;
  std::int64_t folderCount = 0;
  std::int64_t duplicateCount = 0;
  std::int64_t errorCount = 0;
};

struct OperationLogEntry {
  int id = 0;
  std::int64_t executedAt = 0;
  std::string operation;
  std::string source;
  std::string destination;
  bool dryRun = true;
  bool success = false;
  std::string message;
};

} // namespace drivesage
