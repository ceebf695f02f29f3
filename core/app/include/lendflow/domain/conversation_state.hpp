#pragma once

#include "lendflow/domain/loan_enums.hpp"
#include "lendflow/safeguard/call_guard.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace lendflow {
namespace domain {

enum class Speaker {
  Customer,
  Assistant,
};

const char* toString(Speaker speaker);

// One transcript entry.
struct ChatMessage {
  Speaker speaker{Speaker::Customer};
  std::string text;
};

// -----------------------------------------------------------------------------
// ConversationState — everything known about one loan conversation
// -----------------------------------------------------------------------------
//
// @brief  Mutable record of a single conversation: stage, identity, request,
//         credit profile, income, derived decision, outcome, safeguard
//         bookkeeping and transcript.
//
// @details
// Fields are filled progressively as the conversation advances:
//
//   identity        customer_id, customer_name, phone, pan_number
//   request         requested_amount, tenure_months, purpose
//   credit profile  preapproved_limit, credit_score, interest_rate,
//                   max_tenure_months (set once from the lookup)
//   income          salary, employer, salary_slip_received, kyc_verified
//   derived         emi, decision, rejection_reason, suggested_amount
//   outcome         sanction_id, document_available, terminal_state
//
// Invariants maintained by the ConversationOrchestrator:
//   - terminal_state is assigned at most once; after that, stage is frozen
//     and no decision unit is invoked again.
//   - emi and decision always reflect the most recent underwriting run.
//   - messages is append-only.
//
// Thread model:
//   Not thread-safe. Owned exclusively by one ConversationOrchestrator and
//   mutated only while that orchestrator processes a turn.
// -----------------------------------------------------------------------------
struct ConversationState {
  explicit ConversationState(std::string id, int max_agent_calls = 6);

  std::string conversation_id;
  Stage stage{Stage::Intro};

  // --- Identity --------------------------------------------------------------
  std::optional<std::string> customer_id;
  std::optional<std::string> customer_name;
  std::optional<std::string> phone;
  std::optional<std::string> pan_number;

  // --- Request ---------------------------------------------------------------
  std::optional<double> requested_amount;
  std::optional<int> tenure_months;
  std::optional<std::string> purpose;

  // --- Credit profile --------------------------------------------------------
  std::optional<double> preapproved_limit;
  std::optional<int> credit_score;
  std::optional<double> interest_rate;
  std::optional<int> max_tenure_months;

  // --- Income ----------------------------------------------------------------
  std::optional<double> salary;
  std::optional<std::string> employer;
  bool salary_slip_received{false};
  bool kyc_verified{false};

  // --- Derived ---------------------------------------------------------------
  std::optional<double> emi;
  std::optional<Decision> decision;
  std::optional<std::string> rejection_reason;
  std::optional<double> suggested_amount;

  // --- Outcome ---------------------------------------------------------------
  std::optional<std::string> sanction_id;
  bool document_available{false};
  std::optional<TerminalState> terminal_state;

  // --- Safeguard + transcript ------------------------------------------------
  CallGuard call_guard;
  std::vector<ChatMessage> messages;

  bool isTerminal() const { return terminal_state.has_value(); }

  void addMessage(Speaker speaker, std::string text);

  // The last n transcript entries, oldest first.
  std::vector<ChatMessage> recentMessages(std::size_t n) const;
};

// -----------------------------------------------------------------------------
// toDisplayJson(state)
// -----------------------------------------------------------------------------
//
// @brief  Display snapshot for hosts and telemetry.
//
// @details
// Unset optionals serialize as null. The call-signature history is never
// included; only the running total and the budget are exposed.
// -----------------------------------------------------------------------------
nlohmann::json toDisplayJson(const ConversationState& state);

}  // namespace domain
}  // namespace lendflow
