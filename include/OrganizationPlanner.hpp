#pragma once
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace drivesage {

class OrganizationPlanner {
public:
  // Moves every loose file with a known extension into a type folder next to
  // it, then deletes the system files found by the analysis.
  std::vector<Operation> plan(const AnalysisReport &report) const;

  // "jpg" -> "Images", ... ; nullopt for unmapped extensions.
  static std::optional<std::string>
  destinationFolder(const std::string &extension);
};

} // namespace drivesage
