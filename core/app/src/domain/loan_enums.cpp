#include "lendflow/domain/loan_enums.hpp"

#include <array>

namespace lendflow {
namespace domain {

// -----------------------------------------------------------------------------
// toString(Stage)
// -----------------------------------------------------------------------------
const char* toString(Stage stage) {
  switch (stage) {
    case Stage::Intro:              return "INTRO";
    case Stage::NeedDiscovery:      return "NEED_DISCOVERY";
    case Stage::OfferPresentation:  return "OFFER_PRESENTATION";
    case Stage::KycVerification:    return "KYC_VERIFICATION";
    case Stage::Underwriting:       return "UNDERWRITING";
    case Stage::DocumentCollection: return "DOCUMENT_COLLECTION";
    case Stage::Sanction:           return "SANCTION";
    case Stage::Rejection:          return "REJECTION";
    case Stage::End:                return "END";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// toString(Decision)
// -----------------------------------------------------------------------------
const char* toString(Decision decision) {
  switch (decision) {
    case Decision::Approved:       return "APPROVED";
    case Decision::Rejected:       return "REJECTED";
    case Decision::NeedSalarySlip: return "NEED_SALARY_SLIP";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// toString(TerminalState)
// -----------------------------------------------------------------------------
const char* toString(TerminalState state) {
  switch (state) {
    case TerminalState::LoanSanctioned:             return "LOAN_SANCTIONED";
    case TerminalState::LoanRejected:               return "LOAN_REJECTED";
    case TerminalState::AdditionalDocumentRequired: return "ADDITIONAL_DOCUMENT_REQUIRED";
    case TerminalState::CustomerDropped:            return "CUSTOMER_DROPPED";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// stageFromString(): linear scan over every stage
// -----------------------------------------------------------------------------
std::optional<Stage> stageFromString(const std::string& name) {
  static constexpr std::array<Stage, 9> kStages{
      Stage::Intro,           Stage::NeedDiscovery,
      Stage::OfferPresentation, Stage::KycVerification,
      Stage::Underwriting,    Stage::DocumentCollection,
      Stage::Sanction,        Stage::Rejection,
      Stage::End};

  for (Stage s : kStages) {
    if (name == toString(s)) {
      return s;
    }
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace lendflow
