#include "lendflow/time/simulation_time_provider.hpp"

namespace lendflow {

// -----------------------------------------------------------------------------
// now_ms()
// -----------------------------------------------------------------------------
std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

// -----------------------------------------------------------------------------
// advance_time()
// -----------------------------------------------------------------------------
void SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

}  // namespace lendflow
