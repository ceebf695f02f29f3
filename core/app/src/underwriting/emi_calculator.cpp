#include "lendflow/underwriting/emi_calculator.hpp"

#include "lendflow/domain/money.hpp"

#include <cmath>
#include <stdexcept>

namespace lendflow {

namespace {

double monthlyRate(double annual_rate_percent) {
  if (annual_rate_percent < 0.0) {
    throw std::invalid_argument("interest rate must not be negative");
  }
  return annual_rate_percent / 12.0 / 100.0;
}

}  // namespace

// -----------------------------------------------------------------------------
// computeEmi()
// -----------------------------------------------------------------------------
double computeEmi(double principal, double annual_rate_percent,
                  int tenure_months) {
  if (principal <= 0.0) {
    throw std::invalid_argument("principal must be positive");
  }
  if (tenure_months <= 0) {
    throw std::invalid_argument("tenure must be positive");
  }

  const double r = monthlyRate(annual_rate_percent);
  if (r == 0.0) {
    return domain::roundTo(principal / tenure_months, 2);
  }

  const double growth = std::pow(1.0 + r, tenure_months);
  return domain::roundTo(principal * r * growth / (growth - 1.0), 2);
}

// -----------------------------------------------------------------------------
// maxPrincipalForEmi()
// -----------------------------------------------------------------------------
double maxPrincipalForEmi(double max_emi, double annual_rate_percent,
                          int tenure_months) {
  if (tenure_months <= 0) {
    throw std::invalid_argument("tenure must be positive");
  }

  const double r = monthlyRate(annual_rate_percent);
  if (r == 0.0) {
    return domain::roundTo(max_emi * tenure_months, 0);
  }

  const double growth = std::pow(1.0 + r, tenure_months);
  return domain::roundTo(max_emi * (growth - 1.0) / (r * growth), 0);
}

}  // namespace lendflow
