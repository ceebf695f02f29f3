#pragma once

#include <optional>
#include <string>

namespace lendflow {
namespace domain {

// -----------------------------------------------------------------------------
// Stage — conversation state machine
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every stage a loan conversation can occupy.
//
// @details
// The orchestrator enforces the transition graph below. Every stage except
// END may also jump straight to END when a terminal status is reached.
//
//   INTRO ──> NEED_DISCOVERY ──> OFFER_PRESENTATION ──> KYC_VERIFICATION
//                                                             │
//                                                             ▼
//                        DOCUMENT_COLLECTION  <───────>  UNDERWRITING
//                                                        │         │
//                                                        ▼         ▼
//                                                    SANCTION   REJECTION
//                                                        │         │
//                                                        └──> END <┘
//
// Thread model:
//   Plain enum. Safe to copy and compare from any thread.
// -----------------------------------------------------------------------------
enum class Stage {
  Intro,
  NeedDiscovery,
  OfferPresentation,
  KycVerification,
  Underwriting,
  DocumentCollection,
  Sanction,
  Rejection,
  End,
};

// -----------------------------------------------------------------------------
// Decision — outcome of one eligibility evaluation
// -----------------------------------------------------------------------------
enum class Decision {
  Approved,
  Rejected,
  NeedSalarySlip,
};

// -----------------------------------------------------------------------------
// TerminalState — final status of a conversation, orthogonal to Stage
// -----------------------------------------------------------------------------
//
// @details
// Set at most once per conversation. Once set, the stage no longer advances
// and no collaborator is called again.
// -----------------------------------------------------------------------------
enum class TerminalState {
  LoanSanctioned,
  LoanRejected,
  AdditionalDocumentRequired,
  CustomerDropped,
};

// Wire names ("OFFER_PRESENTATION", "NEED_SALARY_SLIP", "LOAN_SANCTIONED").
const char* toString(Stage stage);
const char* toString(Decision decision);
const char* toString(TerminalState state);

// Inverse of toString(Stage). Returns std::nullopt for unknown names.
std::optional<Stage> stageFromString(const std::string& name);

}  // namespace domain
}  // namespace lendflow
