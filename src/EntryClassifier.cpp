#include "EntryClassifier.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace drivesage {

namespace {
const std::array<const char *, 4> kSystemFileNames = {
    ".DS_Store", "Thumbs.db", ".Spotlight-V100", ".fseventsd"};
}

std::string toLowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool isLargeFile(std::int64_t size, std::int64_t threshold) {
  return size > threshold;
}

bool isSystemFile(const std::string &name) {
  return std::any_of(kSystemFileNames.begin(), kSystemFileNames.end(),
                     [&](const char *systemName) { return name == systemName; });
}

std::optional<std::string>
matchProtectedPattern(const std::string &name,
                      const std::vector<std::string> &patterns) {
  const std::string lowerName = toLowercase(name);
  for (const auto &pattern : patterns) {
    if (lowerName.find(toLowercase(pattern)) != std::string::npos)
      return pattern;
  }
  return std::nullopt;
}

bool isProtectedFile(const std::string &name,
                     const std::vector<std::string> &patterns) {
  return matchProtectedPattern(name, patterns).has_value();
}

} // namespace drivesage
