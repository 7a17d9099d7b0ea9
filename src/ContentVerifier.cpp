#include "ContentVerifier.hpp"
#include <fstream>
#include <iostream>

#include <picosha2.h>

namespace drivesage {

std::optional<std::string>
ContentVerifier::calculateHash(const std::string &absPath) const {
  std::ifstream f(absPath, std::ios::binary);
  if (!f.is_open())
    return std::nullopt;

  std::vector<unsigned char> hash(picosha2::k_digest_size);
  picosha2::hash256(f, hash.begin(), hash.end());
  return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

std::optional<std::string> ContentVerifier::hashFile(const std::string &absPath) {
  auto cached = m_cache.find(absPath);
  if (cached != m_cache.end())
    return cached->second;

  auto hash = calculateHash(absPath);
  if (!hash)
    std::cerr << "[Verifier] Unable to read file: " << absPath << std::endl;
  m_cache.emplace(absPath, hash);
  return hash;
}

std::vector<DuplicateRecord>
ContentVerifier::verify(const std::vector<DuplicateRecord> &candidates) {
  std::vector<DuplicateRecord> confirmed;
  for (const auto &candidate : candidates) {
    auto originalHash = hashFile(candidate.original);
    auto duplicateHash = hashFile(candidate.duplicate);
    if (originalHash && duplicateHash && *originalHash == *duplicateHash)
      confirmed.push_back(candidate);
  }
  std::cout << "[Verifier] " << confirmed.size() << " of " << candidates.size()
            << " duplicate candidates confirmed by content" << std::endl;
  return confirmed;
}

} // namespace drivesage
