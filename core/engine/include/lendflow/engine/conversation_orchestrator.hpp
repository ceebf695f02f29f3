#pragma once

#include "lendflow/collaborators/i_customer_lookup.hpp"
#include "lendflow/collaborators/i_document_generator.hpp"
#include "lendflow/collaborators/i_field_extractor.hpp"
#include "lendflow/domain/conversation_policy.hpp"
#include "lendflow/domain/conversation_state.hpp"
#include "lendflow/domain/underwriting_policy.hpp"
#include "lendflow/eventbus/event_bus.hpp"
#include "lendflow/intent/intent_classifier.hpp"
#include "lendflow/time/i_time_provider.hpp"
#include "lendflow/underwriting/eligibility_engine.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <exception>
#include <optional>
#include <string>

namespace lendflow {

// -----------------------------------------------------------------------------
// Collaborators — the external services one conversation talks to
// -----------------------------------------------------------------------------
// Non-owning. Every referenced object must outlive the orchestrators built
// from it. Implementations must tolerate calls from several conversations
// on different threads.
// -----------------------------------------------------------------------------
struct Collaborators {
  ICustomerLookup& lookup;
  IFieldExtractor& extractor;
  IDocumentGenerator& documents;
};

// Result of one processed customer message.
struct TurnReply {
  std::string reply_text;
  nlohmann::json state;  // toDisplayJson() snapshot taken after the turn
};

// -----------------------------------------------------------------------------
// ConversationOrchestrator
// -----------------------------------------------------------------------------
//
// @brief  Drives one loan conversation through its stages, one customer
//         message at a time.
//
// @details
// Each stage has a handler. processMessage() runs the handler for the
// current stage, and keeps running handlers in the same turn while the
// stage it just entered is marked auto-continue in the ConversationPolicy.
// A turn stops at the first suspend point:
//
//   - the handler yielded (it asked the customer something),
//   - a terminal status was assigned,
//   - the stage did not change,
//   - or the new stage is not auto-continue.
//
// Every counted decision-unit invocation goes through the CallGuard owned
// by the ConversationState. Counted units and their hashed inputs:
//
//   FIELD_EXTRACTOR     {"message"}
//   KYC_LOOKUP          {"phone"}
//   ELIGIBILITY_ENGINE  {requested_amount, tenure_months, preapproved_limit,
//                        credit_score, interest_rate, salary}
//   DOCUMENT_GENERATOR  {customer_id, approved_amount, tenure_months,
//                        interest_rate, emi}   budget only, no duplicate check
//
// The offer lookup in NEED_DISCOVERY is not counted.
//
// Error handling:
//   Business outcomes (not found, KYC pending, rejection) are regular
//   branches. A std::exception escaping a collaborator ends the
//   conversation as CUSTOMER_DROPPED with an apology. A refused guard
//   check ends it as CUSTOMER_DROPPED without moving the stage.
//
// Thread model:
//   Not thread-safe. One turn at a time; ConversationManager serializes
//   turns per conversation. Events are published synchronously on the
//   calling thread.
//
// Ownership:
//   Owns the ConversationState, IntentClassifier and EligibilityEngine.
//   Borrows the collaborators, the clock and the (optional) EventBus.
// -----------------------------------------------------------------------------
class ConversationOrchestrator {
 public:
  static constexpr const char* kFieldExtractor = "FIELD_EXTRACTOR";
  static constexpr const char* kKycLookup = "KYC_LOOKUP";
  static constexpr const char* kEligibilityEngine = "ELIGIBILITY_ENGINE";
  static constexpr const char* kDocumentGenerator = "DOCUMENT_GENERATOR";

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  conversation_id      Identifier carried on every event.
  // @param  collaborators        Lookup, extraction and document services.
  // @param  conversation_policy  Call budget, context window, auto-continue.
  // @param  underwriting_policy  Rule-engine thresholds.
  // @param  clock                Timestamp source for events.
  // @param  bus                  Optional; nullptr disables events.
  // -------------------------------------------------------------------------
  ConversationOrchestrator(std::string conversation_id,
                           Collaborators collaborators,
                           domain::ConversationPolicy conversation_policy,
                           domain::UnderwritingPolicy underwriting_policy,
                           const ITimeProvider& clock,
                           EventBus* bus = nullptr);

  ConversationOrchestrator(const ConversationOrchestrator&) = delete;
  ConversationOrchestrator& operator=(const ConversationOrchestrator&) = delete;

  // -------------------------------------------------------------------------
  // processMessage(text)
  // -------------------------------------------------------------------------
  //
  // @brief  Processes one customer message and returns the reply.
  //
  // @details
  // Once a terminal status is set, every further message gets a fixed
  // closing reply and leaves the state untouched (not even the transcript
  // grows). When the call budget is already spent at the start of a turn,
  // the conversation is dropped with a diagnostic and the stage stays put.
  // -------------------------------------------------------------------------
  TurnReply processMessage(const std::string& text);

  const domain::ConversationState& state() const { return state_; }

 private:
  // Output of one stage handler.
  struct StageStep {
    std::string text;
    bool yield{false};
  };

  // Upper bound on handlers run in one turn; one per stage is enough.
  static constexpr int kMaxStagesPerTurn = 9;

  StageStep dispatch(const std::string& message);

  StageStep handleIntro(const std::string& message);
  StageStep handleNeedDiscovery(const std::string& message);
  StageStep handleOfferPresentation(const std::string& message);
  StageStep handleKycVerification();
  StageStep handleUnderwriting();
  StageStep handleDocumentCollection(const std::string& message);
  StageStep handleSanction();
  StageStep handleRejection();
  StageStep handleEnd() const;

  // Returns nullopt when the guard allows the call (and records it);
  // otherwise the step that drops the conversation.
  std::optional<StageStep> admit(const char* agent,
                                 const nlohmann::json& inputs,
                                 bool check_duplicate = true);

  StageStep safeguardDrop(const std::string& agent, GuardVerdict verdict);
  StageStep collaboratorFault(const std::exception& error);

  // Assigns the terminal status, moves to END and publishes the close.
  StageStep finish(domain::TerminalState terminal, std::string text,
                   std::optional<std::string> reason = std::nullopt);

  void transitionTo(domain::Stage next);

  Timestamp now() const;
  std::uint64_t nextSequence() { return ++sequence_; }
  void publish(const Event& event);

  domain::ConversationState state_;
  Collaborators collaborators_;
  domain::ConversationPolicy policy_;
  EligibilityEngine engine_;
  IntentClassifier classifier_;
  const ITimeProvider& clock_;
  EventBus* bus_;
  std::uint64_t sequence_{0};
};

}  // namespace lendflow
