#include "OperationExecutor.hpp"
#include <exception>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace drivesage {

namespace {

void moveEntry(const fs::path &source, const fs::path &destination) {
  if (!fs::exists(fs::symlink_status(source))) {
    throw fs::filesystem_error(
        "source does not exist", source,
        std::make_error_code(std::errc::no_such_file_or_directory));
  }
  if (fs::exists(fs::symlink_status(destination))) {
    throw fs::filesystem_error("destination already exists", destination,
                               std::make_error_code(std::errc::file_exists));
  }
  if (destination.has_parent_path())
    fs::create_directories(destination.parent_path());

  std::error_code ec;
  fs::rename(source, destination, ec);
  if (ec == std::errc::cross_device_link) {
    fs::copy(source, destination,
             fs::copy_options::recursive | fs::copy_options::copy_symlinks);
    fs::remove_all(source);
  } else if (ec) {
    throw fs::filesystem_error("move failed", source, destination, ec);
  }
}

void removeEntry(const fs::path &path) {
  if (!fs::exists(fs::symlink_status(path))) {
    throw fs::filesystem_error(
        "path does not exist", path,
        std::make_error_code(std::errc::no_such_file_or_directory));
  }
  fs::remove_all(path);
}

struct OperationApplier {
  bool dryRun;
  OperationResult &result;

  void operator()(const MoveOperation &op) const {
    if (!dryRun)
      moveEntry(op.source, op.destination);
    result.moved.push_back(op);
    result.outcomes.push_back({"move", op.source, op.destination, true, ""});
    std::cout << "[Executor] File moved: " << op.source << " -> "
              << op.destination << (dryRun ? " (dry run)" : "") << std::endl;
  }

  void operator()(const DeleteOperation &op) const {
    if (!dryRun)
      removeEntry(op.path);
    result.deleted.push_back(op.path);
    result.outcomes.push_back({"delete", op.path, "", true, ""});
    std::cout << "[Executor] File deleted: " << op.path
              << (dryRun ? " (dry run)" : "") << std::endl;
  }

  void operator()(const RenameOperation &op) const {
    if (!dryRun)
      moveEntry(op.oldPath, op.newPath);
    result.renamed.push_back(op);
    result.outcomes.push_back({"rename", op.oldPath, op.newPath, true, ""});
    std::cout << "[Executor] File renamed: " << op.oldPath << " -> "
              << op.newPath << (dryRun ? " (dry run)" : "") << std::endl;
  }
};

struct NameVisitor {
  std::string operator()(const MoveOperation &) const { return "move"; }
  std::string operator()(const DeleteOperation &) const { return "delete"; }
  std::string operator()(const RenameOperation &) const { return "rename"; }
};

struct PathVisitor {
  std::string operator()(const MoveOperation &op) const { return op.source; }
  std::string operator()(const DeleteOperation &op) const { return op.path; }
  std::string operator()(const RenameOperation &op) const { return op.oldPath; }
};

struct DestinationVisitor {
  std::string operator()(const MoveOperation &op) const {
    return op.destination;
  }
  std::string operator()(const DeleteOperation &) const { return ""; }
  std::string operator()(const RenameOperation &op) const { return op.newPath; }
};

} // namespace

std::string OperationExecutor::operationName(const Operation &operation) {
  if (operation.valueless_by_exception())
    return "unknown";
  return std::visit(NameVisitor{}, operation);
}

std::string OperationExecutor::operationPath(const Operation &operation) {
  if (operation.valueless_by_exception())
    return "";
  return std::visit(PathVisitor{}, operation);
}

OperationResult
OperationExecutor::execute(const std::vector<Operation> &operations,
                           bool dryRun) {
  std::cout << "[Executor] Starting file organization: " << operations.size()
            << " operations" << (dryRun ? " (dry run)" : "") << std::endl;
  OperationResult result;
  result.summary.total = operations.size();
  for (const auto &operation : operations)
    apply(operation, dryRun, result);
  logSummary(result, dryRun);
  return result;
}

OperationResult OperationExecutor::execute(const std::vector<PlanEntry> &entries,
                                           bool dryRun) {
  std::cout << "[Executor] Starting file organization: " << entries.size()
            << " operations" << (dryRun ? " (dry run)" : "") << std::endl;
  OperationResult result;
  result.summary.total = entries.size();
  for (const auto &entry : entries) {
    if (!entry.operation) {
      recordFailure(entry.type, entry.path, "",
                    entry.error.empty() ? "unsupported operation" : entry.error,
                    result);
      continue;
    }
    apply(*entry.operation, dryRun, result);
  }
  logSummary(result, dryRun);
  return result;
}

void OperationExecutor::apply(const Operation &operation, bool dryRun,
                              OperationResult &result) {
  if (operation.valueless_by_exception()) {
    recordFailure("unknown", "", "", "unsupported operation", result);
    return;
  }

  try {
    std::visit(OperationApplier{dryRun, result}, operation);
    result.summary.successful++;
  } catch (const std::exception &e) {
    recordFailure(operationName(operation), operationPath(operation),
                  std::visit(DestinationVisitor{}, operation), e.what(), result);
  }
}

void OperationExecutor::recordFailure(const std::string &operation,
                                      const std::string &path,
                                      const std::string &destination,
                                      const std::string &message,
                                      OperationResult &result) {
  std::cerr << "[Executor] Operation failed: " << operation << " " << path
            << " - " << message << std::endl;
  result.errors.push_back({operation, path, message});
  result.outcomes.push_back({operation, path, destination, false, message});
  result.summary.failed++;
}

void OperationExecutor::logSummary(const OperationResult &result,
                                   bool dryRun) const {
  std::cout << "[Executor] File organization completed"
            << (dryRun ? " (dry run)" : "") << ": " << result.summary.successful
            << " successful, " << result.summary.failed << " failed of "
            << result.summary.total << std::endl;
}

} // namespace drivesage
