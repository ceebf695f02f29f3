#pragma once

#include "lendflow/domain/loan_enums.hpp"
#include "lendflow/domain/underwriting_policy.hpp"

#include <optional>
#include <string>

namespace lendflow {

// -----------------------------------------------------------------------------
// UnderwritingRequest — one eligibility question
// -----------------------------------------------------------------------------
struct UnderwritingRequest {
  double requested_amount{0.0};
  int tenure_months{0};
  double preapproved_limit{0.0};
  int credit_score{0};
  double interest_rate{0.0};

  /// Monthly salary, present only once income proof has been received.
  /// A non-positive value is treated as absent.
  std::optional<double> salary;
};

// -----------------------------------------------------------------------------
// UnderwritingResult — the engine's answer
// -----------------------------------------------------------------------------
//
// @details
// emi is unset when the request never got past validation, the credit
// floor, or the hard ceiling. approved_amount is set only for APPROVED.
// suggested_amount is set only for an affordability rejection in the
// stretch zone. max_eligible_amount is set only for a ceiling rejection.
// tenure_months is the tenure actually used after normalization.
// -----------------------------------------------------------------------------
struct UnderwritingResult {
  domain::Decision decision{domain::Decision::Rejected};
  std::optional<double> emi;
  std::string reason;
  std::optional<double> approved_amount;
  std::optional<double> suggested_amount;
  std::optional<double> max_eligible_amount;
  int tenure_months{0};
};

// -----------------------------------------------------------------------------
// EligibilityEngine — deterministic loan eligibility rules
// -----------------------------------------------------------------------------
//
// @brief  Evaluates one UnderwritingRequest against an UnderwritingPolicy
//         and returns APPROVED, REJECTED or NEED_SALARY_SLIP.
//
// @details
// Rule order (first match wins):
//
//   0. requested_amount <= 0                 → REJECTED ("invalid amount")
//   1. credit_score < min_credit_score       → REJECTED, no EMI
//   2. amount <= limit                       → APPROVED
//   3. amount <= limit * stretch_multiplier
//        no salary                           → NEED_SALARY_SLIP (EMI set)
//        EMI <= salary * ratio               → APPROVED
//        otherwise                           → REJECTED + suggested amount
//   4. otherwise                             → REJECTED, max eligible set
//
// The engine is a pure function of (policy, request). It performs no I/O,
// holds no mutable state, and never retries.
//
// Thread model:
//   decide() is const and may be called concurrently from any thread.
//
// Ownership:
//   Holds the policy by value.
// -----------------------------------------------------------------------------
class EligibilityEngine {
 public:
  explicit EligibilityEngine(domain::UnderwritingPolicy policy = {});

  // -------------------------------------------------------------------------
  // decide(request)
  // -------------------------------------------------------------------------
  //
  // @brief  Applies the rule order above to one request.
  //
  // @return UnderwritingResult with a human-readable reason. Never throws
  //         for business outcomes; invalid input is reported as REJECTED.
  // -------------------------------------------------------------------------
  UnderwritingResult decide(const UnderwritingRequest& request) const;

  const domain::UnderwritingPolicy& policy() const { return policy_; }

 private:
  domain::UnderwritingPolicy policy_;
};

}  // namespace lendflow
