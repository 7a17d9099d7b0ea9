#include "Application.hpp"
#include "AppState.hpp"
#include "CommandHandlers.hpp"
#include "ConfigManager.hpp"
#include "DatabaseManager.hpp"
#include "ReportSerializer.hpp"
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace drivesage {

namespace {

// While active, everything written to std::cout goes to std::clog instead.
// Output meant for stdout is written through original().
class StdoutRedirect {
public:
  explicit StdoutRedirect(bool active) : m_stdout(std::cout.rdbuf()) {
    if (active)
      std::cout.rdbuf(std::clog.rdbuf());
  }
  ~StdoutRedirect() { std::cout.rdbuf(m_stdout); }

  std::streambuf *original() const { return m_stdout; }

private:
  std::streambuf *m_stdout;
};

void printAnalysis(std::ostream &out, const json &data) {
  const auto &meta = data["metadata"];
  out << "Drive:       " << meta["drivePath"].get<std::string>() << "\n"
      << "Total size:  "
      << formatFileSize(meta["totalSize"].get<std::int64_t>())
      << "\n"
      << "Files:       " << meta["fileCount"] << "\n"
      << "Folders:     " << meta["folderCount"] << "\n"
      << "Large files: " << data["largeFiles"].size() << "\n"
      << "System files: " << data["systemFiles"].size() << "\n"
      << "Protected:   " << data["protectedFiles"].size() << "\n"
      << "Duplicates:  " << data["duplicates"].size() << "\n"
      << "Errors:      " << data["errors"].size() << std::endl;

  for (const auto &file : data["largeFiles"]) {
    out << "  [large] " << file["relativePath"].get<std::string>()
        << " (" << formatFileSize(file["size"].get<std::int64_t>()) << ")\n";
  }
  for (const auto &file : data["protectedFiles"]) {
    out << "  [protected] " << file["relativePath"].get<std::string>()
        << " - " << file["reason"].get<std::string>() << "\n";
  }
  for (const auto &error : data["errors"]) {
    out << "  [error] " << error["path"].get<std::string>() << ": "
        << error["error"].get<std::string>() << "\n";
  }
}

void printDuplicates(std::ostream &out, const json &data) {
  out << "Found " << data.size() << " duplicates" << std::endl;
  for (const auto &duplicate : data) {
    out << "  " << duplicate["relativePath"].get<std::string>() << " ("
        << formatFileSize(duplicate["size"].get<std::int64_t>()) << ")\n"
        << "    original: " << duplicate["original"].get<std::string>()
        << "\n";
  }
}

void printOperationResult(std::ostream &out, const json &data) {
  const auto &summary = data["summary"];
  out << "Total operations: " << summary["total"] << "\n"
      << "Successful:       " << summary["successful"] << "\n"
      << "Failed:           " << summary["failed"] << std::endl;
  for (const auto &op : data["moved"]) {
    out << "  Move   " << op["source"].get<std::string>() << " -> "
        << op["destination"].get<std::string>() << "\n";
  }
  for (const auto &op : data["renamed"]) {
    out << "  Rename " << op["oldPath"].get<std::string>() << " -> "
        << op["newPath"].get<std::string>() << "\n";
  }
  for (const auto &path : data["deleted"])
    out << "  Delete " << path.get<std::string>() << "\n";
  for (const auto &error : data["errors"]) {
    out << "  Error  " << error["path"].get<std::string>() << ": "
        << error["error"].get<std::string>() << "\n";
  }
}

void printHistory(std::ostream &out, const json &data) {
  out << "Recent scans:" << std::endl;
  for (const auto &scan : data["scans"]) {
    out << "  #" << scan["id"] << " " << scan["drivePath"].get<std::string>()
        << " - " << scan["fileCount"] << " files, "
        << formatFileSize(scan["totalSize"].get<std::int64_t>()) << ", "
        << scan["duplicateCount"] << " duplicates\n";
  }
  out << "Recent operations:" << std::endl;
  for (const auto &op : data["operations"]) {
    out << "  #" << op["id"] << " " << op["operation"].get<std::string>()
        << " " << op["source"].get<std::string>()
        << (op["dryRun"].get<bool>() ? " (dry run)" : "")
        << (op["success"].get<bool>() ? "" : " FAILED") << "\n";
  }
}

bool hasFailedOperations(const json &response) {
  return response["success"].get<bool>() && response["data"].contains("summary") &&
         response["data"]["summary"]["failed"].get<std::size_t>() > 0;
}

} // namespace

int runCommand(const CliOptions &options) {
  // Log lines must not end up in the JSON document
  StdoutRedirect redirect(options.jsonOutput);
  std::ostream out(redirect.original());

  try {
    // 1. Settings
    ConfigManager config(options.configPath);
    config.load();

    AppState state;
    state.settings = config.settings();

    if (options.command == "settings") {
      json patch = json::object();
      if (options.patterns)
        patch["protectedPatterns"] =
            ConfigManager::parsePatternList(*options.patterns);
      if (options.dryRun)
        patch["dryRun"] = *options.dryRun;
      if (!patch.empty() && !config.updateSettings(patch)) {
        std::cerr << "[Main] Failed to save settings." << std::endl;
        return 1;
      }
      out << json(config.settings()).dump(2) << std::endl;
      return 0;
    }

    // 2. Database
    auto database = std::make_unique<DatabaseManager>(state.settings.databasePath);
    if (database->open() && database->initializeSchema()) {
      state.database = database.get();
    } else {
      std::cerr << "[Main] Continuing without scan history." << std::endl;
    }

    // 3. Command
    json response;
    const std::string command = options.command;
    if (command == "analyze") {
      response = handleAnalyzeDrive(state, options.arguments[0]);
    } else if (command == "duplicates") {
      response = handleFindDuplicates(state, options.arguments[0]);
    } else if (command == "organize") {
      if (options.apply)
        state.settings.dryRun = false;
      response = handleAnalyzeDrive(state, options.arguments[0]);
      if (response["success"].get<bool>())
        response = handleOrganizeFiles(state);
    } else if (command == "execute") {
      std::ifstream in(options.arguments[0]);
      if (!in.is_open()) {
        std::cerr << "[Main] Unable to read plan: " << options.arguments[0]
                  << std::endl;
        return 1;
      }
      json plan = json::parse(in);
      bool dryRun = options.apply ? false : state.settings.dryRun;
      response = handleExecutePlan(state, plan, dryRun);
    } else if (command == "delete") {
      response = handleDeleteFile(state, options.arguments[0]);
    } else if (command == "history") {
      response = handleHistory(state);
    }

    if (options.jsonOutput) {
      out << response.dump(2) << std::endl;
    } else if (!response["success"].get<bool>()) {
      std::cerr << "[Main] " << command
                << " failed: " << response["error"].get<std::string>()
                << std::endl;
    } else if (command == "analyze") {
      printAnalysis(out, response["data"]);
    } else if (command == "duplicates") {
      printDuplicates(out, response["data"]);
    } else if (command == "history") {
      printHistory(out, response["data"]);
    } else {
      printOperationResult(out, response["data"]);
    }

    if (!response["success"].get<bool>() || hasFailedOperations(response))
      return 1;

  } catch (const std::exception &e) {
    std::cerr << "[Main] Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}

} // namespace drivesage
