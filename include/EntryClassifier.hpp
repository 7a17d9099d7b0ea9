#pragma once
#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace drivesage {

bool isLargeFile(std::int64_t size,
                 std::int64_t threshold = kLargeFileThreshold);

// .DS_Store, Thumbs.db, .Spotlight-V100, .fseventsd
bool isSystemFile(const std::string &name);

// Plain substring match on the lowercased name, so "aircraft.png" is
// protected by the "ai" pattern.
bool isProtectedFile(const std::string &name,
                     const std::vector<std::string> &patterns);

std::optional<std::string>
matchProtectedPattern(const std::string &name,
                      const std::vector<std::string> &patterns);

std::string toLowercase(std::string value);

} // namespace drivesage
