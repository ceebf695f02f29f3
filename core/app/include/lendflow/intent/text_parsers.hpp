#pragma once

#include <optional>
#include <string>

namespace lendflow {

// -----------------------------------------------------------------------------
// Text heuristics shared by the intent classifier and the orchestrator
// -----------------------------------------------------------------------------
//
// @brief  Small, deterministic parsers for customer free text.
//
// @details
// These are not a natural-language layer. They recognise the handful of
// shapes the conversation depends on (a mobile number, a salary figure) and
// return std::nullopt for everything else so the caller can re-prompt.
//
// Thread-safety: Stateless; safe to call from any thread.
// -----------------------------------------------------------------------------

// ASCII lower-casing; multi-byte UTF-8 sequences pass through unchanged.
std::string toLowerAscii(std::string text);

// Digits-only view of a run of digits separated by ',' e.g. "40,000" →
// "40000". Other characters are preserved.
std::string stripDigitGrouping(const std::string& text);

// -------------------------------------------------------------------------
// extractPhoneNumber
// -------------------------------------------------------------------------
// @brief  Finds a 10 digit mobile number.
//
// @details
// Strips "+91", dashes and spaces, then takes the first ten contiguous
// digits, skipping a leading "91" country code when twelve are present.
//   "My number is +91 98765-43210" → "9876543210"
//   "9876543210 2 lakh"            → "9876543210"
//   "call 12345"                   → std::nullopt
// -------------------------------------------------------------------------
std::optional<std::string> extractPhoneNumber(const std::string& text);

// -------------------------------------------------------------------------
// parseSalaryFigure
// -------------------------------------------------------------------------
// @brief  Reads a monthly salary figure in rupees.
//
// @details
// Checked in order, first match wins:
//   "1.2 lakh", "1 lac", "1.5l"  → value * 100000
//   "45k"                       → value * 1000
//   "₹45000", "rs. 45,000"      → a plain 4 to 7 digit number
// Returns std::nullopt when nothing matches or the value is not positive.
// -------------------------------------------------------------------------
std::optional<double> parseSalaryFigure(const std::string& text);

}  // namespace lendflow
