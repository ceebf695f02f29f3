#include "lendflow/safeguard/input_hash.hpp"

#include <cstdio>

namespace lendflow {

namespace {

constexpr std::uint64_t kFnvOffsetBasis = 0xcbf29ce484222325ULL;
constexpr std::uint64_t kFnvPrime = 0x100000001b3ULL;

}  // namespace

// -----------------------------------------------------------------------------
// fnv1a64()
// -----------------------------------------------------------------------------
std::uint64_t fnv1a64(const std::string& bytes) {
  std::uint64_t hash = kFnvOffsetBasis;
  for (unsigned char c : bytes) {
    hash ^= static_cast<std::uint64_t>(c);
    hash *= kFnvPrime;
  }
  return hash;
}

// -----------------------------------------------------------------------------
// computeInputHash()
// -----------------------------------------------------------------------------
std::string computeInputHash(const nlohmann::json& inputs) {
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx",
                static_cast<unsigned long long>(fnv1a64(inputs.dump())));
  return std::string(buf, 16);
}

}  // namespace lendflow
