#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace drivesage {

// nlohmann/json conversions, found through ADL.
void to_json(nlohmann::json &j, const FolderProfile &folder);
void to_json(nlohmann::json &j, const FileRecord &file);
void to_json(nlohmann::json &j, const DuplicateRecord &duplicate);
void to_json(nlohmann::json &j, const ScanError &error);
void to_json(nlohmann::json &j, const AnalysisReport &report);
void to_json(nlohmann::json &j, const Operation &operation);
void to_json(nlohmann::json &j, const OperationResult &result);
void to_json(nlohmann::json &j, const ScanHistoryEntry &entry);
void to_json(nlohmann::json &j, const OperationLogEntry &entry);
void to_json(nlohmann::json &j, const Settings &settings);
// Throws nlohmann::json::exception on mistyped values.
void from_json(const nlohmann::json &j, Settings &settings);

// {"type": "move"|"delete"|"rename", ...}. Unknown types and entries with
// missing fields yield a PlanEntry without an operation.
PlanEntry planEntryFromJson(const nlohmann::json &item);
std::vector<PlanEntry> parsePlan(const nlohmann::json &plan);

nlohmann::json successEnvelope(nlohmann::json data);
nlohmann::json errorEnvelope(const std::string &message);

} // namespace drivesage
