#pragma once
#include "types.hpp"
#include <optional>
#include <string>

namespace drivesage {

class DatabaseManager;

// State of one application session, owned by main() and handed to the
// command handlers.
struct AppState {
  Settings settings;
  std::optional<std::string> currentDrive;
  std::optional<AnalysisReport> analysis;
  bool isScanning = false;
  bool isOrganizing = false;
  DatabaseManager *database = nullptr; // Optional, not owned
};

} // namespace drivesage
