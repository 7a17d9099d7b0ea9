#include "DatabaseManager.hpp"
#include <chrono>
#include <iostream>
#include <sqlite3.h>
#include <sqlite_orm/sqlite_orm.h>

using namespace sqlite_orm;

namespace drivesage {

// Helper to deduce the storage type.
inline auto create_storage_impl(const std::string &path) {
  return make_storage(
      path,
      make_table<ScanHistoryEntry>(
          "ScanHistory",
          make_column("id", &ScanHistoryEntry::id, primary_key()),
          make_column("drivePath", &ScanHistoryEntry::drivePath),
          make_column("scannedAt", &ScanHistoryEntry::scannedAt),
          make_column("totalSize", &ScanHistoryEntry::totalSize),
          make_column("fileCount", &ScanHistoryEntry::fileCount),
          make_column("folderCount", &ScanHistoryEntry::folderCount),
          make_column("duplicateCount", &ScanHistoryEntry::duplicateCount),
          make_column("errorCount", &ScanHistoryEntry::errorCount)),
      make_table<OperationLogEntry>(
          "OperationLog",
          make_column("id", &OperationLogEntry::id, primary_key()),
          make_column("executedAt", &OperationLogEntry::executedAt),
          make_column("operation", &OperationLogEntry::operation),
          make_column("source", &OperationLogEntry::source),
          make_column("destination", &OperationLogEntry::destination),
          make_column("dryRun", &OperationLogEntry::dryRun),
          make_column("success", &OperationLogEntry::success),
          make_column("message", &OperationLogEntry::message)));
}

using Storage = decltype(create_storage_impl(""));

struct DatabaseManager::Impl {
  Storage storage;
  Impl(const std::string &path) : storage(create_storage_impl(path)) {}
};

namespace {
std::int64_t unixNow() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}
} // namespace

DatabaseManager::DatabaseManager(const std::string &dbPath)
    : m_dbPath(dbPath), m_impl(std::make_unique<Impl>(dbPath)) {}

DatabaseManager::~DatabaseManager() = default;

bool DatabaseManager::open() {
  try {
    m_impl->storage.open_forever();
    std::cout << "[DB] Database opened: " << m_dbPath << std::endl;
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[DB] Failed to open database " << m_dbPath << ": "
              << e.what() << std::endl;
    return false;
  }
}

bool DatabaseManager::initializeSchema() {
  try {
    m_impl->storage.sync_schema();
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[DB] Schema synchronization failed: " << e.what()
              << std::endl;
    return false;
  }
}

std::optional<int> DatabaseManager::recordScan(const AnalysisReport &report) {
  ScanHistoryEntry entry;
  entry.drivePath = report.drivePath;
  entry.scannedAt = report.scanTime;
  entry.totalSize = report.totalSize;
  entry.fileCount = report.fileCount;
  entry.folderCount = report.folderCount;
  entry.duplicateCount = static_cast<std::int64_t>(report.duplicates.size());
  entry.errorCount = static_cast<std::int64_t>(report.errors.size());
  try {
    return static_cast<int>(m_impl->storage.insert(entry));
  } catch (const std::exception &e) {
    std::cerr << "[DB] recordScan Error: " << e.what() << std::endl;
    return std::nullopt;
  }
}

std::optional<std::vector<ScanHistoryEntry>>
DatabaseManager::getScanHistory(std::size_t limit) {
  try {
    return m_impl->storage.get_all<ScanHistoryEntry>(
        order_by(&ScanHistoryEntry::id).desc(),
        sqlite_orm::limit(static_cast<int>(limit)));
  } catch (const std::exception &e) {
    std::cerr << "[DB] getScanHistory Error: " << e.what() << std::endl;
    return std::nullopt;
  }
}

bool DatabaseManager::recordOperations(const OperationResult &result,
                                       bool dryRun) {
  std::vector<OperationLogEntry> entries;
  const auto executedAt = unixNow();
  for (const auto &outcome : result.outcomes) {
    OperationLogEntry entry;
    entry.executedAt = executedAt;
    entry.operation = outcome.operation;
    entry.source = outcome.source;
    entry.destination = outcome.destination;
    entry.dryRun = dryRun;
    entry.success = outcome.success;
    entry.message = outcome.message;
    entries.push_back(entry);
  }

  try {
    m_impl->storage.transaction([&] {
      for (const auto &entry : entries)
        m_impl->storage.insert(entry);
      return true;
    });
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[DB] recordOperations Error: " << e.what() << std::endl;
    return false;
  }
}

std::optional<std::vector<OperationLogEntry>>
DatabaseManager::getOperationLog(std::size_t limit) {
  try {
    return m_impl->storage.get_all<OperationLogEntry>(
        order_by(&OperationLogEntry::id).desc(),
        sqlite_orm::limit(static_cast<int>(limit)));
  } catch (const std::exception &e) {
    std::cerr << "[DB] getOperationLog Error: " << e.what() << std::endl;
    return std::nullopt;
  }
}

} // namespace drivesage
