#include "ReportSerializer.hpp"
#include <variant>

using json = nlohmann::json;

namespace drivesage {

namespace {

std::string stringField(const json &item, const char *key) {
  if (!item.contains(key) || !item[key].is_string())
    return "";
  return item[key].get<std::string>();
}

} // namespace

void to_json(json &j, const FolderProfile &folder) {
  json looseFiles = json::array();
  for (const auto &file : folder.looseFiles) {
    looseFiles.push_back(
        {{"name", file.name}, {"size", file.size}, {"modified", file.modified}});
  }
  j = json{{"name", folder.name},
           {"path", folder.path},
           {"relativePath", folder.relativePath},
           {"size", folder.size},
           {"fileCount", folder.fileCount},
           {"subfolders", folder.subfolders},
           {"looseFiles", looseFiles},
           {"lastModified", nullptr}};
  if (folder.lastModified)
    j["lastModified"] = *folder.lastModified;
}

void to_json(json &j, const FileRecord &file) {
  j = json{{"name", file.name},
           {"path", file.path},
           {"relativePath", file.relativePath},
           {"size", file.size},
           {"modified", file.modified}};
  if (file.reason)
    j["reason"] = *file.reason;
}

void to_json(json &j, const DuplicateRecord &duplicate) {
  j = json{{"original", duplicate.original},
           {"duplicate", duplicate.duplicate},
           {"relativePath", duplicate.relativePath},
           {"size", duplicate.size},
           {"modified", duplicate.modified}};
}

void to_json(json &j, const ScanError &error) {
  j = json{{"path", error.path}, {"error", error.message}};
}

void to_json(json &j, const AnalysisReport &report) {
  j = json{{"metadata",
            {{"scanTime", report.scanTime},
             {"drivePath", report.drivePath},
             {"totalSize", report.totalSize},
             {"fileCount", report.fileCount},
             {"folderCount", report.folderCount}}},
           {"folders", report.folders},
           {"largeFiles", report.largeFiles},
           {"duplicates", report.duplicates},
           {"systemFiles", report.systemFiles},
           {"protectedFiles", report.protectedFiles},
           {"errors", report.errors}};
}

void to_json(json &j, const Operation &operation) {
  if (const auto *move = std::get_if<MoveOperation>(&operation)) {
    j = json{{"type", "move"},
             {"source", move->source},
             {"destination", move->destination}};
  } else if (const auto *del = std::get_if<DeleteOperation>(&operation)) {
    j = json{{"type", "delete"}, {"path", del->path}};
  } else if (const auto *rename = std::get_if<RenameOperation>(&operation)) {
    j = json{{"type", "rename"},
             {"oldPath", rename->oldPath},
             {"newPath", rename->newPath}};
  } else {
    j = json{{"type", "unknown"}};
  }
}

void to_json(json &j, const OperationResult &result) {
  json moved = json::array();
  for (const auto &op : result.moved)
    moved.push_back({{"source", op.source}, {"destination", op.destination}});
  json renamed = json::array();
  for (const auto &op : result.renamed)
    renamed.push_back({{"oldPath", op.oldPath}, {"newPath", op.newPath}});
  json errors = json::array();
  for (const auto &error : result.errors) {
    errors.push_back({{"operation", error.operation},
                      {"path", error.path},
                      {"error", error.message}});
  }

  j = json{{"moved", moved},
           {"deleted", result.deleted},
           {"renamed", renamed},
           {"errors", errors},
           {"summary",
            {{"total", result.summary.total},
             {"successful", result.summary.successful},
             {"failed", result.summary.failed}}}};
}

void to_json(json &j, const ScanHistoryEntry &entry) {
  j = json{{"id", entry.id},
           {"drivePath", entry.drivePath},
           {"scannedAt", entry.scannedAt},
           {"totalSize", entry.totalSize},
           {"fileCount", entry.fileCount},
           {"folderCount", entry.folderCount},
           {"duplicateCount", entry.duplicateCount},
           {"errorCount", entry.errorCount}};
}

void to_json(json &j, const OperationLogEntry &entry) {
  j = json{{"id", entry.id},
           {"executedAt", entry.executedAt},
           {"operation", entry.operation},
           {"source", entry.source},
           {"destination", entry.destination},
           {"dryRun", entry.dryRun},
           {"success", entry.success},
           {"message", entry.message}};
}

void to_json(json &j, const Settings &settings) {
  j = json{{"dryRun", settings.dryRun},
           {"protectedPatterns", settings.protectedPatterns},
           {"largeFileThreshold", settings.largeFileThreshold},
           {"followSymlinks", settings.followSymlinks},
           {"verifyDuplicateContent", settings.verifyDuplicateContent},
           {"databasePath", settings.databasePath}};
}

void from_json(const json &j, Settings &settings) {
  if (j.contains("dryRun"))
    j.at("dryRun").get_to(settings.dryRun);
  if (j.contains("protectedPatterns"))
    j.at("protectedPatterns").get_to(settings.protectedPatterns);
  if (j.contains("largeFileThreshold"))
    j.at("largeFileThreshold").get_to(settings.largeFileThreshold);
  if (j.contains("followSymlinks"))
    j.at("followSymlinks").get_to(settings.followSymlinks);
  if (j.contains("verifyDuplicateContent"))
    j.at("verifyDuplicateContent").get_to(settings.verifyDuplicateContent);
  if (j.contains("databasePath"))
    j.at("databasePath").get_to(settings.databasePath);
}

PlanEntry planEntryFromJson(const json &item) {
  PlanEntry entry;
  if (!item.is_object()) {
    entry.error = "unsupported operation: not an object";
    return entry;
  }

  entry.type = stringField(item, "type");
  if (entry.type == "move") {
    MoveOperation op{stringField(item, "source"),
                     stringField(item, "destination")};
    entry.path = op.source;
    if (!op.source.empty() && !op.destination.empty())
      entry.operation = op;
    else
      entry.error = "move requires source and destination";
  } else if (entry.type == "delete") {
    DeleteOperation op{stringField(item, "path")};
    entry.path = op.path;
    if (!op.path.empty())
      entry.operation = op;
    else
      entry.error = "delete requires path";
  } else if (entry.type == "rename") {
    RenameOperation op{stringField(item, "oldPath"),
                       stringField(item, "newPath")};
    entry.path = op.oldPath;
    if (!op.oldPath.empty() && !op.newPath.empty())
      entry.operation = op;
    else
      entry.error = "rename requires oldPath and newPath";
  } else {
    entry.error = "unsupported operation: " + entry.type;
    entry.path = !stringField(item, "source").empty()
                     ? stringField(item, "source")
                     : stringField(item, "path");
  }
  return entry;
}

std::vector<PlanEntry> parsePlan(const json &plan) {
  std::vector<PlanEntry> entries;
  if (!plan.is_array())
    return entries;
  for (const auto &item : plan)
    entries.push_back(planEntryFromJson(item));
  return entries;
}

json successEnvelope(json data) {
  return json{{"success", true}, {"data", std::move(data)}};
}

json errorEnvelope(const std::string &message) {
  return json{{"success", false}, {"error", message}};
}

} // namespace drivesage
