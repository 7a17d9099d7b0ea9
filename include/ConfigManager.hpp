#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace drivesage {

/**
 * ConfigManager keeps the user settings in a JSON file. Saved keys are merged
 * over the defaults; a missing or malformed file leaves the defaults alone.
 */
class ConfigManager {
public:
  explicit ConfigManager(std::string settingsPath);

  bool load();
  bool save() const;
  // Merges `patch` into the current settings and saves them.
  bool updateSettings(const nlohmann::json &patch);

  const Settings &settings() const { return m_settings; }
  const std::string &settingsPath() const { return m_settingsPath; }

  // "a, b,,c " -> {"a", "b", "c"}
  static std::vector<std::string> parsePatternList(const std::string &csv);

private:
  std::string m_settingsPath;
  Settings m_settings;
};

} // namespace drivesage
