#pragma once

namespace lendflow {
namespace domain {

// -----------------------------------------------------------------------------
// UnderwritingPolicy — lender-wide eligibility thresholds
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of the parameters that govern every
//         eligibility decision made by the EligibilityEngine.
//
// @details
// The engine evaluates a request against these values in a fixed order:
//
//   1. credit_score < min_credit_score           → REJECTED (hard floor)
//   2. amount <= preapproved limit               → APPROVED
//   3. amount <= limit * stretch_multiplier      → salary-gated
//        EMI <= salary * max_emi_to_salary_ratio → APPROVED
//        otherwise                               → REJECTED + suggestion
//   4. amount >  limit * stretch_multiplier      → REJECTED (hard ceiling)
//
// default_tenure_months replaces a missing or non-positive tenure.
//
// Values are loaded from the "underwriting" section of the engine config
// (see ConfigLoader). Missing keys keep the defaults below.
//
// Thread model:
//   Plain data struct with value semantics. Copied into the engine at
//   construction time; no shared mutable state.
// -----------------------------------------------------------------------------
struct UnderwritingPolicy {
  /// Credit scores strictly below this value are rejected outright.
  int min_credit_score{700};

  /// Highest share of monthly salary the EMI may consume in the stretch zone.
  double max_emi_to_salary_ratio{0.5};

  /// Upper bound of the stretch zone, as a multiple of the pre-approved limit.
  double stretch_multiplier{2.0};

  /// Tenure used when the request carries none (or a non-positive one).
  int default_tenure_months{12};

  /// Upper end of the credit score scale. Only used in reason texts.
  int max_credit_score{900};
};

}  // namespace domain
}  // namespace lendflow
