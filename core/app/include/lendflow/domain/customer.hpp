#pragma once

#include <optional>
#include <string>

namespace lendflow {
namespace domain {

// -----------------------------------------------------------------------------
// PreapprovedOffer — lender's standing offer for one customer
// -----------------------------------------------------------------------------
//
// @details
// An offer with a non-positive limit or an offer_type of "NONE" exists in
// the book but cannot be presented; see usable().
// -----------------------------------------------------------------------------
struct PreapprovedOffer {
  double limit{0.0};
  double interest_rate{0.0};
  int max_tenure_months{0};
  std::string offer_type;

  bool usable() const { return limit > 0.0 && offer_type != "NONE"; }
};

// -----------------------------------------------------------------------------
// CustomerRecord — CRM / KYC / bureau view of one customer
// -----------------------------------------------------------------------------
struct CustomerRecord {
  std::string customer_id;
  std::string name;
  std::string phone;
  std::string pan_number;
  std::string city;

  int credit_score{0};
  bool kyc_verified{false};

  double monthly_salary{0.0};
  std::string employer;

  std::optional<PreapprovedOffer> offer;
};

// Bureau bucket for a score: EXCELLENT (>=800), GOOD (>=750), FAIR (>=700),
// POOR (>=650), otherwise VERY_POOR.
inline const char* creditRating(int score) {
  if (score >= 800) return "EXCELLENT";
  if (score >= 750) return "GOOD";
  if (score >= 700) return "FAIR";
  if (score >= 650) return "POOR";
  return "VERY_POOR";
}

}  // namespace domain
}  // namespace lendflow
