#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace lendflow {

// -----------------------------------------------------------------------------
// Input hashing for call signatures
// -----------------------------------------------------------------------------
//
// @brief  Stable, order-independent digest of a decision unit's inputs.
//
// @details
// The inputs are a JSON object. nlohmann::json stores object members in a
// std::map, so dump() always emits keys in sorted order: two maps with the
// same entries serialize identically regardless of insertion order. The
// serialized text is hashed with 64-bit FNV-1a and rendered as 16 lowercase
// hex digits.
//
// The digest is a loop detector, not a security primitive.
//
// Thread-safety: Stateless; safe to call from any thread.
// -----------------------------------------------------------------------------

// FNV-1a, 64-bit, over raw bytes.
std::uint64_t fnv1a64(const std::string& bytes);

// 16 hex digit digest of inputs.dump().
std::string computeInputHash(const nlohmann::json& inputs);

}  // namespace lendflow
