#pragma once

#include "lendflow/time/i_time_provider.hpp"

namespace lendflow {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Reads std::chrono::system_clock. Used by the lendflow executable.
//
// Thread model:
//   Stateless; safe to call from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace lendflow
