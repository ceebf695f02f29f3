#include "lendflow/underwriting/eligibility_engine.hpp"

#include "lendflow/domain/customer.hpp"
#include "lendflow/domain/money.hpp"
#include "lendflow/underwriting/emi_calculator.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace lendflow {

using domain::Decision;
using domain::formatRupees;

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
EligibilityEngine::EligibilityEngine(domain::UnderwritingPolicy policy)
    : policy_(std::move(policy)) {}

// -----------------------------------------------------------------------------
// decide(): first matching rule wins
// -----------------------------------------------------------------------------
UnderwritingResult EligibilityEngine::decide(
    const UnderwritingRequest& request) const {
  UnderwritingResult result;
  result.tenure_months = request.tenure_months > 0
                             ? request.tenure_months
                             : policy_.default_tenure_months;

  // --- Validation -----------------------------------------------------------
  if (request.requested_amount <= 0.0) {
    result.decision = Decision::Rejected;
    result.reason = "invalid amount: requested amount must be positive";
    return result;
  }

  std::ostringstream score;
  score << request.credit_score << "/" << policy_.max_credit_score;

  // --- Rule 1: credit floor -------------------------------------------------
  if (request.credit_score < policy_.min_credit_score) {
    result.decision = Decision::Rejected;
    result.reason = "Credit score (" + score.str() +
                    ") is below minimum requirement (" +
                    std::to_string(policy_.min_credit_score) + ")";
    return result;
  }

  const double emi = computeEmi(request.requested_amount,
                                request.interest_rate, result.tenure_months);

  // --- Rule 2: within pre-approved limit ------------------------------------
  if (request.requested_amount <= request.preapproved_limit) {
    result.decision = Decision::Approved;
    result.emi = emi;
    result.approved_amount = request.requested_amount;
    result.reason = "Loan approved within pre-approved limit of " +
                    formatRupees(request.preapproved_limit) +
                    ". Credit score: " + score.str() + " (" +
                    domain::creditRating(request.credit_score) + ")";
    return result;
  }

  const double ceiling =
      request.preapproved_limit * policy_.stretch_multiplier;

  // --- Rule 3: stretch zone, gated on income --------------------------------
  if (request.requested_amount <= ceiling) {
    result.emi = emi;

    const bool has_salary = request.salary && *request.salary > 0.0;
    if (!has_salary) {
      result.decision = Decision::NeedSalarySlip;
      result.reason = "Requested amount (" +
                      formatRupees(request.requested_amount) +
                      ") exceeds pre-approved limit (" +
                      formatRupees(request.preapproved_limit) +
                      "). Credit score: " + score.str() +
                      ". Income verification required.";
      return result;
    }

    const double salary = *request.salary;
    const double max_emi = salary * policy_.max_emi_to_salary_ratio;

    if (emi <= max_emi) {
      std::ostringstream share;
      share << std::fixed << std::setprecision(1) << (emi / salary) * 100.0;

      result.decision = Decision::Approved;
      result.approved_amount = request.requested_amount;
      result.reason = "Loan approved after income verification. Credit score: " +
                      score.str() + ". Monthly salary: " +
                      formatRupees(salary) + ", EMI: " + formatRupees(emi) +
                      " (" + share.str() + "% of salary)";
      return result;
    }

    const double suggested = maxPrincipalForEmi(
        max_emi, request.interest_rate, result.tenure_months);

    std::ostringstream ratio;
    ratio << static_cast<int>(policy_.max_emi_to_salary_ratio * 100.0 + 0.5);

    result.decision = Decision::Rejected;
    result.suggested_amount = suggested;
    result.reason = "EMI (" + formatRupees(emi) + ") exceeds " + ratio.str() +
                    "% of monthly salary (" + formatRupees(salary) +
                    "). Maximum affordable loan is " + formatRupees(suggested);
    return result;
  }

  // --- Rule 4: hard ceiling -------------------------------------------------
  result.decision = Decision::Rejected;
  result.max_eligible_amount = ceiling;
  result.reason = "Requested amount (" +
                  formatRupees(request.requested_amount) +
                  ") exceeds maximum eligible limit (" + formatRupees(ceiling) +
                  "). Credit score: " + score.str() + ".";
  return result;
}

}  // namespace lendflow
