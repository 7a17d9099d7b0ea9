#pragma once
#include "types.hpp"
#include <string>
#include <vector>

namespace drivesage {

/**
 * OperationExecutor applies (or, in dry run, only records) a list of
 * operations strictly in input order. Every operation succeeds or fails on
 * its own; a failure is recorded in the result and the batch continues.
 *
 * Callers must not run two executors against overlapping paths at the same
 * time, there is no locking.
 */
class OperationExecutor {
public:
  OperationResult execute(const std::vector<Operation> &operations,
                          bool dryRun);

  // Entries without an operation are recorded as unsupported.
  OperationResult execute(const std::vector<PlanEntry> &entries, bool dryRun);

  static std::string operationName(const Operation &operation);
  static std::string operationPath(const Operation &operation);

private:
  void apply(const Operation &operation, bool dryRun, OperationResult &result);
  void recordFailure(const std::string &operation, const std::string &path,
                     const std::string &destination, const std::string &message,
                     OperationResult &result);
  void logSummary(const OperationResult &result, bool dryRun) const;
};

} // namespace drivesage
