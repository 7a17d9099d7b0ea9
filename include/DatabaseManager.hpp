#pragma once
#include "types.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace drivesage {

/**
 * DatabaseManager keeps a history of completed analyses and a log of every
 * executed operation in SQLite (through sqlite_orm).
 */
class DatabaseManager {
public:
  explicit DatabaseManager(const std::string &dbPath);
  ~DatabaseManager();

  // The connection stays open until the manager is destroyed.
  bool open();
  bool initializeSchema();

  // Scan history
  std::optional<int> recordScan(const AnalysisReport &report);
  std::optional<std::vector<ScanHistoryEntry>>
  getScanHistory(std::size_t limit = 20);

  // Operation log
  bool recordOperations(const OperationResult &result, bool dryRun);
  std::optional<std::vector<OperationLogEntry>>
  getOperationLog(std::size_t limit = 50);

private:
  std::string m_dbPath;
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace drivesage
