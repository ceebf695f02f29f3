#pragma once

#include <cstdint>

namespace lendflow {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that hides where "now" comes from.
//
// @details
// Sanction references, letter dates and event timestamps all read the
// clock. Injecting it keeps those outputs reproducible in tests:
//   - LiveTimeProvider       → std::chrono::system_clock.
//   - SimulationTimeProvider → a value the test sets explicitly.
//
// Components receive `const ITimeProvider&` and call now_ms() whenever they
// need a timestamp.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time as milliseconds since the Unix epoch (UTC).
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace lendflow
