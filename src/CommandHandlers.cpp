#include "CommandHandlers.hpp"
#include "DatabaseManager.hpp"
#include "DriveAnalyzer.hpp"
#include "OperationExecutor.hpp"
#include "OrganizationPlanner.hpp"
#include "ReportSerializer.hpp"
#include <iostream>

using json = nlohmann::json;

namespace drivesage {

namespace {

// Clears a busy flag on every exit path.
class BusyGuard {
public:
  explicit BusyGuard(bool &flag) : m_flag(flag) { m_flag = true; }
  ~BusyGuard() { m_flag = false; }
  BusyGuard(const BusyGuard &) = delete;
  BusyGuard &operator=(const BusyGuard &) = delete;

private:
  bool &m_flag;
};

void journal(AppState &state, const OperationResult &result, bool dryRun) {
  if (state.database && !state.database->recordOperations(result, dryRun))
    std::cerr << "[Main] Operation log could not be written" << std::endl;
}

std::optional<AnalysisReport> runAnalysis(AppState &state,
                                          const std::string &drivePath,
                                          std::string &error) {
  if (state.isScanning) {
    error = "a scan is already in progress";
    return std::nullopt;
  }
  BusyGuard busy(state.isScanning);
  try {
    DriveAnalyzer analyzer(state.settings);
    AnalysisReport report = analyzer.analyze(drivePath);
    state.currentDrive = report.drivePath;
    state.analysis = report;
    if (state.database && !state.database->recordScan(report))
      std::cerr << "[Main] Scan history could not be written" << std::endl;
    return report;
  } catch (const AnalysisError &e) {
    std::cerr << "[Main] analyze-drive failed: " << e.what() << std::endl;
    error = e.what();
    return std::nullopt;
  }
}

} // namespace

json handleAnalyzeDrive(AppState &state, const std::string &drivePath) {
  std::string error;
  auto report = runAnalysis(state, drivePath, error);
  if (!report)
    return errorEnvelope(error);
  return successEnvelope(*report);
}

json handleFindDuplicates(AppState &state, const std::string &drivePath) {
  std::string error;
  auto report = runAnalysis(state, drivePath, error);
  if (!report)
    return errorEnvelope(error);
  return successEnvelope(report->duplicates);
}

json handleOrganizeFiles(AppState &state) {
  if (!state.analysis)
    return errorEnvelope("scan a drive first");
  if (state.isOrganizing)
    return errorEnvelope("an organization is already in progress");
  BusyGuard busy(state.isOrganizing);

  OrganizationPlanner planner;
  std::vector<Operation> operations = planner.plan(*state.analysis);
  OperationExecutor executor;
  OperationResult result = executor.execute(operations, state.settings.dryRun);
  journal(state, result, state.settings.dryRun);
  return successEnvelope(result);
}

json handleExecutePlan(AppState &state, const json &plan, bool dryRun) {
  if (!plan.is_array())
    return errorEnvelope("plan must be a JSON array of operations");
  if (state.isOrganizing)
    return errorEnvelope("an organization is already in progress");
  BusyGuard busy(state.isOrganizing);

  OperationExecutor executor;
  OperationResult result = executor.execute(parsePlan(plan), dryRun);
  journal(state, result, dryRun);
  return successEnvelope(result);
}

json handleDeleteFile(AppState &state, const std::string &path) {
  if (state.isOrganizing)
    return errorEnvelope("an organization is already in progress");
  BusyGuard busy(state.isOrganizing);

  OperationExecutor executor;
  OperationResult result =
      executor.execute(std::vector<Operation>{DeleteOperation{path}}, false);
  journal(state, result, false);
  return successEnvelope(result);
}

json handleHistory(AppState &state) {
  if (!state.database)
    return errorEnvelope("no database configured");
  auto scans = state.database->getScanHistory();
  auto operations = state.database->getOperationLog();
  if (!scans || !operations)
    return errorEnvelope("history could not be read");
  return successEnvelope(json{{"scans", *scans}, {"operations", *operations}});
}

} // namespace drivesage
