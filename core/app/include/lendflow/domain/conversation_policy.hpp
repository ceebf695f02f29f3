#pragma once

#include "lendflow/domain/loan_enums.hpp"

#include <cstddef>
#include <map>

namespace lendflow {
namespace domain {

// -----------------------------------------------------------------------------
// ConversationPolicy — orchestration limits and same-turn advance flags
// -----------------------------------------------------------------------------
//
// @brief  Parameters that shape how the ConversationOrchestrator drives a
//         single conversation.
//
// @details
// max_agent_calls bounds the number of counted collaborator / rule-engine
// invocations for the lifetime of one conversation. Reaching it forces the
// conversation to CUSTOMER_DROPPED.
//
// max_message_chars caps one inbound customer message. A longer message is
// answered with a request to shorten it; no stage handler sees it.
//
// extraction_context_messages is the number of most recent transcript
// entries handed to the field extractor as context.
//
// auto_continue decides, per stage, whether a stage entered in the middle of
// a turn is processed within that same turn or waits for the next inbound
// message. A stage absent from the map does not auto-continue.
//
// Thread model:
//   Value type, copied into each orchestrator.
// -----------------------------------------------------------------------------
struct ConversationPolicy {
  int max_agent_calls{6};

  std::size_t max_message_chars{2000};

  std::size_t extraction_context_messages{4};

  std::map<Stage, bool> auto_continue{
      {Stage::NeedDiscovery, true},
      {Stage::KycVerification, true},
      {Stage::Underwriting, true},
      {Stage::Sanction, true},
      {Stage::Rejection, true},
  };

  bool autoContinues(Stage stage) const {
    auto it = auto_continue.find(stage);
    return it != auto_continue.end() && it->second;
  }
};

}  // namespace domain
}  // namespace lendflow
