#pragma once

#include "lendflow/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace lendflow {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — explicitly driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is whatever advance_time() last stored.
//
// @details
// Tests pin the clock to a known instant so sanction references and letter
// dates are predictable, e.g. advance_time(1718454600000) makes every
// reference start with "LF-20240615123000-".
//
// Starts at 0 (1970-01-01T00:00:00Z).
//
// Thread model:
//   std::atomic storage; advance_time() and now_ms() may race freely.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock. Monotonicity is not enforced.
  void advance_time(std::int64_t new_time_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace lendflow
