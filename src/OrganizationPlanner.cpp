#include "OrganizationPlanner.hpp"
#include "EntryClassifier.hpp"
#include <filesystem>
#include <iostream>
#include <map>

namespace fs = std::filesystem;

namespace drivesage {

namespace {
const std::map<std::string, std::string> kDestinationFolders = {
    {"jpg", "Images"},     {"jpeg", "Images"},    {"png", "Images"},
    {"gif", "Images"},     {"pdf", "Documents"},  {"doc", "Documents"},
    {"docx", "Documents"}, {"txt", "Documents"},  {"mp4", "Videos"},
    {"mov", "Videos"},     {"mp3", "Audio"},      {"wav", "Audio"}};
}

std::optional<std::string>
OrganizationPlanner::destinationFolder(const std::string &extension) {
  auto it = kDestinationFolders.find(toLowercase(extension));
  if (it == kDestinationFolders.end())
    return std::nullopt;
  return it->second;
}

std::vector<Operation>
OrganizationPlanner::plan(const AnalysisReport &report) const {
  std::vector<Operation> operations;

  for (const auto &folder : report.folders) {
    for (const auto &file : folder.looseFiles) {
      // Dotfiles and names without an extension stay where they are
      auto dot = file.name.rfind('.');
      if (dot == std::string::npos || file.name.front() == '.')
        continue;

      auto destination = destinationFolder(file.name.substr(dot + 1));
      if (!destination)
        continue;

      fs::path folderPath{folder.path};
      operations.push_back(MoveOperation{
          (folderPath / file.name).string(),
          (folderPath / *destination / file.name).string()});
    }
  }

  for (const auto &file : report.systemFiles)
    operations.push_back(DeleteOperation{file.path});

  std::cout << "[Planner] Planned " << operations.size() << " operations"
            << std::endl;
  return operations;
}

} // namespace drivesage
