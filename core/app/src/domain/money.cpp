#include "lendflow/domain/money.hpp"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace lendflow {
namespace domain {

// -----------------------------------------------------------------------------
// roundTo()
// -----------------------------------------------------------------------------
double roundTo(double value, int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

// -----------------------------------------------------------------------------
// formatRupees(): integer part grouped in threes, optional fraction
// -----------------------------------------------------------------------------
std::string formatRupees(double amount, int decimals) {
  const bool negative = amount < 0.0;
  const double scale = std::pow(10.0, decimals);
  const auto scaled =
      static_cast<std::int64_t>(std::llround(std::fabs(amount) * scale));
  const auto divisor = static_cast<std::int64_t>(scale);

  std::string digits = std::to_string(scaled / divisor);
  std::string grouped;
  grouped.reserve(digits.size() + digits.size() / 3);
  const std::size_t lead = digits.size() % 3;
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (i != 0 && (i % 3) == lead % 3) {
      grouped.push_back(',');
    }
    grouped.push_back(digits[i]);
  }

  std::string out = negative ? "-₹" : "₹";
  out += grouped;

  if (decimals > 0) {
    std::string fraction = std::to_string(scaled % divisor);
    // Left-pad so 5 paise renders as ".05", not ".5".
    fraction.insert(0, static_cast<std::size_t>(decimals) - fraction.size(),
                    '0');
    out += '.';
    out += fraction;
  }
  return out;
}

}  // namespace domain
}  // namespace lendflow
