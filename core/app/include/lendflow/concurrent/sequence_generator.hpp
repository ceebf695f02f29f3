#pragma once

#include <atomic>
#include <cstdint>

namespace lendflow {

// -----------------------------------------------------------------------------
// SequenceGenerator — thread-safe, monotonically increasing sequence source
// -----------------------------------------------------------------------------
//
// @brief  Produces unique, monotonically increasing 64-bit values via an
//         atomic counter.
//
// @details
// Values start at 1 (0 is reserved as an "unset" sentinel). Used as the
// per-letter discriminator when issuing sanction references.
//
// fetch_add with memory_order_relaxed is sufficient: the only requirement
// is uniqueness, not ordering relative to other memory operations.
//
// Thread model:
//   next() is safe to call concurrently from any number of threads.
//
// Ownership:
//   Held as a value member by SanctionDocumentGenerator. Never global.
// -----------------------------------------------------------------------------
class SequenceGenerator {
 public:
  SequenceGenerator() = default;

  // Non-copyable, non-movable: two copies would hand out duplicate values.
  SequenceGenerator(const SequenceGenerator&) = delete;
  SequenceGenerator& operator=(const SequenceGenerator&) = delete;
  SequenceGenerator(SequenceGenerator&&) = delete;
  SequenceGenerator& operator=(SequenceGenerator&&) = delete;

  std::uint64_t next() {
    return next_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_{1};
};

}  // namespace lendflow
