#pragma once

#include <string>

namespace lendflow {
namespace domain {

// -----------------------------------------------------------------------------
// Money helpers
// -----------------------------------------------------------------------------
//
// @brief  Rounding and display formatting for rupee amounts.
//
// @details
// All amounts in the engine are plain doubles in rupees. Rounding happens
// at well-defined points (EMI to paise, suggested principal to whole
// rupees) so that identical inputs always produce identical outputs.
//
// Thread-safety: Stateless; safe to call from any thread.
// -----------------------------------------------------------------------------

// Rounds half away from zero to the given number of decimal places.
double roundTo(double value, int decimals);

// Formats an amount with a rupee sign and thousands separators, e.g.
// formatRupees(500000) == "₹500,000", formatRupees(10036.09, 2) ==
// "₹10,036.09".
std::string formatRupees(double amount, int decimals = 0);

}  // namespace domain
}  // namespace lendflow
