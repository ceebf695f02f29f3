#pragma once

namespace lendflow {

// -----------------------------------------------------------------------------
// EMI arithmetic
// -----------------------------------------------------------------------------
//
// @brief  Standard reducing-balance annuity formulas used by underwriting.
//
// @details
// With r = annual_rate_percent / 12 / 100 and n = tenure_months:
//
//   EMI       = P * r * (1+r)^n / ((1+r)^n - 1)
//   Principal = EMI * ((1+r)^n - 1) / (r * (1+r)^n)
//
// A zero rate degenerates to straight-line repayment (P / n and EMI * n).
//
// Both functions are pure and deterministic: identical arguments always
// yield bit-identical results.
//
// Thread-safety: Stateless; safe to call from any thread.
// -----------------------------------------------------------------------------

// -------------------------------------------------------------------------
// computeEmi
// -------------------------------------------------------------------------
// @brief  Monthly instalment for a principal, rounded to 2 decimal places.
//
// @param  principal            Loan amount in rupees (must be > 0).
// @param  annual_rate_percent  Nominal annual interest rate, e.g. 12.5.
// @param  tenure_months        Number of monthly instalments (must be > 0).
//
// @throws std::invalid_argument if principal or tenure_months is not
//         positive, or the rate is negative.
// -------------------------------------------------------------------------
double computeEmi(double principal, double annual_rate_percent,
                  int tenure_months);

// -------------------------------------------------------------------------
// maxPrincipalForEmi
// -------------------------------------------------------------------------
// @brief  Largest principal whose EMI does not exceed max_emi, rounded to
//         a whole rupee.
//
// @throws std::invalid_argument if tenure_months is not positive or the
//         rate is negative.
// -------------------------------------------------------------------------
double maxPrincipalForEmi(double max_emi, double annual_rate_percent,
                          int tenure_months);

}  // namespace lendflow
