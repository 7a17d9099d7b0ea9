#pragma once
#include "AppState.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace drivesage {

// Each handler answers with {"success": true, "data": ...} or
// {"success": false, "error": "..."}.

nlohmann::json handleAnalyzeDrive(AppState &state, const std::string &drivePath);

// Runs a full analysis and answers with its duplicates only.
nlohmann::json handleFindDuplicates(AppState &state,
                                    const std::string &drivePath);

// Plans from the current analysis and executes with settings.dryRun.
nlohmann::json handleOrganizeFiles(AppState &state);

nlohmann::json handleExecutePlan(AppState &state, const nlohmann::json &plan,
                                 bool dryRun);

// Always a real deletion of exactly one path.
nlohmann::json handleDeleteFile(AppState &state, const std::string &path);

nlohmann::json handleHistory(AppState &state);

} // namespace drivesage
