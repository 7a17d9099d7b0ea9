#include "ConfigManager.hpp"
#include "ReportSerializer.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace drivesage {

namespace {

std::string trim(const std::string &value) {
  auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) {
               return std::isspace(c);
             }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

ConfigManager::ConfigManager(std::string settingsPath)
    : m_settingsPath(std::move(settingsPath)) {}

bool ConfigManager::load() {
  std::ifstream in(m_settingsPath);
  if (!in.is_open()) {
    std::cout << "[Config] No settings file at " << m_settingsPath
              << ", using defaults" << std::endl;
    return false;
  }

  try {
    json merged = m_settings;
    json saved = json::parse(in);
    if (!saved.is_object()) {
      std::cerr << "[Config] Ignoring settings file, not a JSON object: "
                << m_settingsPath << std::endl;
      return false;
    }
    merged.update(saved);
    Settings loaded;
    merged.get_to(loaded);
    m_settings = std::move(loaded);
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[Config] Failed to load settings: " << e.what() << std::endl;
    return false;
  }
}

bool ConfigManager::save() const {
  try {
    fs::path path{m_settingsPath};
    if (path.has_parent_path())
      fs::create_directories(path.parent_path());
    std::ofstream out(m_settingsPath, std::ios::trunc);
    if (!out.is_open()) {
      std::cerr << "[Config] Unable to write settings: " << m_settingsPath
                << std::endl;
      return false;
    }
    out << json(m_settings).dump(2) << std::endl;
    return static_cast<bool>(out);
  } catch (const std::exception &e) {
    std::cerr << "[Config] Failed to save settings: " << e.what() << std::endl;
    return false;
  }
}

bool ConfigManager::updateSettings(const json &patch) {
  try {
    json merged = m_settings;
    merged.update(patch);
    Settings updated;
    merged.get_to(updated);
    m_settings = std::move(updated);
  } catch (const std::exception &e) {
    std::cerr << "[Config] Rejected settings update: " << e.what() << std::endl;
    return false;
  }
  return save();
}

std::vector<std::string>
ConfigManager::parsePatternList(const std::string &csv) {
  std::vector<std::string> patterns;
  std::stringstream stream(csv);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = trim(item);
    if (!item.empty())
      patterns.push_back(item);
  }
  return patterns;
}

} // namespace drivesage
