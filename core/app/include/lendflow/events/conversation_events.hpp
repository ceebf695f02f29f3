#pragma once

#include "lendflow/domain/loan_enums.hpp"
#include "lendflow/safeguard/call_guard.hpp"
#include "lendflow/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace lendflow {

// -----------------------------------------------------------------------------
// Conversation events
// -----------------------------------------------------------------------------
//
// @brief  Observational events published by ConversationOrchestrator.
//
// @details
// Nothing published here feeds back into a decision; subscribers (console
// logging in main(), the IpcServer telemetry bridge, tests) only watch.
//
// sequence_id is per conversation, starting at 1, so a subscriber can
// order the events of one conversation without relying on timestamps.
//
// Thread model:
//   Published synchronously on the thread processing the turn. Plain data
//   with value semantics; safe to copy across threads.
// -----------------------------------------------------------------------------

// Stage changed within a turn.
struct StageTransitionEvent {
  std::string conversation_id;
  domain::Stage from{domain::Stage::Intro};
  domain::Stage to{domain::Stage::Intro};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// EligibilityEngine produced a decision.
struct UnderwritingDecisionEvent {
  std::string conversation_id;
  domain::Decision decision{domain::Decision::Rejected};
  double requested_amount{0.0};
  std::optional<double> emi;
  std::string reason;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// CallGuard refused an invocation.
struct SafeguardTripEvent {
  std::string conversation_id;
  std::string agent_name;
  GuardVerdict verdict{GuardVerdict::Allowed};
  int total_calls{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// A terminal status was assigned.
struct ConversationClosedEvent {
  std::string conversation_id;
  domain::TerminalState terminal_state{domain::TerminalState::CustomerDropped};
  std::optional<std::string> sanction_id;
  std::optional<std::string> reason;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace lendflow
