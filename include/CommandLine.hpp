#pragma once
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace drivesage {

struct CliOptions {
  bool valid = true;
  bool showHelp = false;
  bool jsonOutput = false;
  bool apply = false;
  std::string configPath = "drivesage-settings.json";
  std::string command;
  std::vector<std::string> arguments;
  std::optional<std::string> patterns;
  std::optional<bool> dryRun;
  std::string errorMessage;
};

void printUsage(std::ostream &out, const std::string &programName);
CliOptions parseCommandLine(int argc, char *argv[]);

// 1536 -> "1.5 KB"
std::string formatFileSize(std::int64_t bytes);

} // namespace drivesage
