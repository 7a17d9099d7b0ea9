#pragma once
#include "types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace drivesage {

/**
 * ContentVerifier is an optional second pass over the name+size duplicate
 * candidates: a candidate is kept only when both files have the same
 * SHA-256 digest. Uses picosha2 for hashing.
 */
class ContentVerifier {
public:
  std::vector<DuplicateRecord>
  verify(const std::vector<DuplicateRecord> &candidates);

  // Hex encoded SHA-256, nullopt when the file cannot be read.
  std::optional<std::string> hashFile(const std::string &absPath);

private:
  std::map<std::string, std::optional<std::string>> m_cache;
  std::optional<std::string> calculateHash(const std::string &absPath) const;
};

} // namespace drivesage
