#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace lendflow {

// -----------------------------------------------------------------------------
// GuardVerdict — outcome of a pre-invocation check
// -----------------------------------------------------------------------------
enum class GuardVerdict {
  Allowed,
  DuplicateCall,    // Same name:inputHash already invoked in this conversation
  BudgetExhausted,  // total calls already at the configured maximum
};

const char* toString(GuardVerdict verdict);

// -----------------------------------------------------------------------------
// CallGuard — per-conversation anti-loop safeguard
// -----------------------------------------------------------------------------
//
// @brief  Bounds the number of decision-unit invocations in one
//         conversation and refuses to repeat an invocation with identical
//         inputs.
//
// @details
// Every counted invocation is identified by its call signature
// "name:inputHash". The guard keeps the ordered history of signatures and a
// running total. Before calling a decision unit the orchestrator asks
// evaluate(); only on Allowed does it call and then recordInvocation().
//
// Evaluation order: the budget is checked first, so an exhausted
// conversation reports BudgetExhausted even for a signature it has seen.
//
// Invariants:
//   - totalCalls() <= maxCalls() at all times.
//   - A signature appears in history() at most once when every recorded
//     call was first evaluated.
//
// Thread model:
//   Not thread-safe. Owned by a ConversationState, which is only ever
//   touched by the turn currently being processed for that conversation.
//
// Ownership:
//   Value type. Copying a state copies its guard.
// -----------------------------------------------------------------------------
class CallGuard {
 public:
  explicit CallGuard(int max_calls = 6);

  // -------------------------------------------------------------------------
  // evaluate(name, input_hash)
  // -------------------------------------------------------------------------
  // @brief  Classifies a prospective invocation without recording it.
  // -------------------------------------------------------------------------
  GuardVerdict evaluate(const std::string& name,
                        const std::string& input_hash) const;

  // True iff evaluate() would return Allowed.
  bool canInvoke(const std::string& name, const std::string& input_hash) const;

  // -------------------------------------------------------------------------
  // recordInvocation(name, input_hash)
  // -------------------------------------------------------------------------
  // @brief  Appends the signature to the history and increments the total.
  //
  // @details
  // The duplicate check is the caller's responsibility (via evaluate());
  // this lets the orchestrator record calls that are exempt from it, such
  // as document generation.
  //
  // @throws std::logic_error if the budget is already exhausted.
  // -------------------------------------------------------------------------
  void recordInvocation(const std::string& name,
                        const std::string& input_hash);

  bool budgetExhausted() const { return total_calls_ >= max_calls_; }

  int totalCalls() const { return total_calls_; }
  int maxCalls() const { return max_calls_; }
  const std::vector<std::string>& history() const { return history_; }

  static std::string signature(const std::string& name,
                               const std::string& input_hash);

 private:
  int max_calls_;
  int total_calls_{0};
  std::vector<std::string> history_;
  std::unordered_set<std::string> seen_;
};

}  // namespace lendflow
