#include "lendflow/safeguard/call_guard.hpp"

#include <stdexcept>
#include <utility>

namespace lendflow {

// -----------------------------------------------------------------------------
// toString(GuardVerdict)
// -----------------------------------------------------------------------------
const char* toString(GuardVerdict verdict) {
  switch (verdict) {
    case GuardVerdict::Allowed:         return "ALLOWED";
    case GuardVerdict::DuplicateCall:   return "DUPLICATE_CALL";
    case GuardVerdict::BudgetExhausted: return "BUDGET_EXHAUSTED";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
CallGuard::CallGuard(int max_calls) : max_calls_(max_calls) {
  if (max_calls_ <= 0) {
    throw std::invalid_argument("max agent calls must be positive");
  }
}

// -----------------------------------------------------------------------------
// evaluate(): budget first, then duplicate signature
// -----------------------------------------------------------------------------
GuardVerdict CallGuard::evaluate(const std::string& name,
                                 const std::string& input_hash) const {
  if (budgetExhausted()) {
    return GuardVerdict::BudgetExhausted;
  }
  if (seen_.count(signature(name, input_hash)) != 0) {
    return GuardVerdict::DuplicateCall;
  }
  return GuardVerdict::Allowed;
}

// -----------------------------------------------------------------------------
// canInvoke()
// -----------------------------------------------------------------------------
bool CallGuard::canInvoke(const std::string& name,
                          const std::string& input_hash) const {
  return evaluate(name, input_hash) == GuardVerdict::Allowed;
}

// -----------------------------------------------------------------------------
// recordInvocation()
// -----------------------------------------------------------------------------
void CallGuard::recordInvocation(const std::string& name,
                                 const std::string& input_hash) {
  if (budgetExhausted()) {
    throw std::logic_error("agent call budget exhausted; cannot record " +
                           name);
  }
  std::string sig = signature(name, input_hash);
  seen_.insert(sig);
  history_.push_back(std::move(sig));
  ++total_calls_;
}

// -----------------------------------------------------------------------------
// signature()
// -----------------------------------------------------------------------------
std::string CallGuard::signature(const std::string& name,
                                 const std::string& input_hash) {
  return name + ":" + input_hash;
}

}  // namespace lendflow
