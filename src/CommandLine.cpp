#include "CommandLine.hpp"
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>

namespace drivesage {

namespace {
// Number of positional arguments each command takes.
const std::map<std::string, std::size_t> kCommandArity = {
    {"analyze", 1}, {"duplicates", 1}, {"organize", 1}, {"execute", 1},
    {"delete", 1},  {"history", 0},    {"settings", 0}};
} // namespace

void printUsage(std::ostream &out, const std::string &programName) {
  out << "Usage: " << programName << " [options] <command> [arguments]\n"
      << "\n"
      << "Commands:\n"
      << "  analyze <path>           Profile a folder tree and flag large, "
         "system and protected files\n"
      << "  duplicates <path>        List files sharing name and size\n"
      << "  organize <path>          Sort loose files into type folders and "
         "remove system files\n"
      << "  execute <plan.json>      Run an explicit JSON list of operations\n"
      << "  delete <file>            Delete one file or folder\n"
      << "  history                  Show recent scans and operations\n"
      << "  settings                 Show or change settings\n"
      << "\n"
      << "Options:\n"
      << "  -h, --help               Show this help message and exit\n"
      << "  --json                   Print JSON instead of a summary\n"
      << "  --config <file>          Settings file (default "
         "drivesage-settings.json)\n"
      << "  --apply                  Perform organize/execute for real\n"
      << "  --patterns \"a, b\"        Protected name patterns (settings)\n"
      << "  --dry-run on|off         Default execution mode (settings)\n";
}

CliOptions parseCommandLine(int argc, char *argv[]) {
  CliOptions options;
  std::vector<std::string> positional;

  for (int index = 1; index < argc; ++index) {
    std::string argument = argv[index];
    if (argument == "-h" || argument == "--help") {
      options.showHelp = true;
    } else if (argument == "--json") {
      options.jsonOutput = true;
    } else if (argument == "--apply") {
      options.apply = true;
    } else if (argument == "--config" || argument == "--patterns" ||
               argument == "--dry-run") {
      if (index + 1 >= argc) {
        options.valid = false;
        options.errorMessage = "Missing value for " + argument;
        return options;
      }
      std::string value = argv[++index];
      if (argument == "--config") {
        options.configPath = value;
      } else if (argument == "--patterns") {
        options.patterns = value;
      } else if (value == "on" || value == "off") {
        options.dryRun = value == "on";
      } else {
        options.valid = false;
        options.errorMessage = "--dry-run expects on or off, got: " + value;
        return options;
      }
    } else if (!argument.empty() && argument.front() == '-') {
      options.valid = false;
      options.errorMessage = "Unknown option: " + argument;
      return options;
    } else {
      positional.push_back(argument);
    }
  }

  if (options.showHelp)
    return options;
  if (positional.empty()) {
    options.valid = false;
    options.errorMessage = "Missing command.";
    return options;
  }

  options.command = positional.front();
  options.arguments.assign(positional.begin() + 1, positional.end());
  auto arity = kCommandArity.find(options.command);
  if (arity == kCommandArity.end()) {
    options.valid = false;
    options.errorMessage = "Unknown command: " + options.command;
  } else if (options.arguments.size() != arity->second) {
    options.valid = false;
    options.errorMessage = "Command " + options.command + " expects " +
                           std::to_string(arity->second) + " argument(s).";
  }
  return options;
}

std::string formatFileSize(std::int64_t bytes) {
  if (bytes <= 0)
    return "0 Bytes";
  static const char *units[] = {"Bytes", "KB", "MB", "GB", "TB"};
  int unit = static_cast<int>(std::floor(std::log(static_cast<double>(bytes)) /
                                         std::log(1024.0)));
  if (unit > 4)
    unit = 4;
  double value = static_cast<double>(bytes) / std::pow(1024.0, unit);

  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value;
  std::string text = out.str();
  // "1.50" -> "1.5", "2.00" -> "2"
  text.erase(text.find_last_not_of('0') + 1);
  if (text.back() == '.')
    text.pop_back();
  return text + " " + units[unit];
}

} // namespace drivesage
