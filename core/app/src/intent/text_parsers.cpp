#include "lendflow/intent/text_parsers.hpp"

#include <cctype>
#include <regex>

namespace lendflow {

// -----------------------------------------------------------------------------
// toLowerAscii()
// -----------------------------------------------------------------------------
std::string toLowerAscii(std::string text) {
  for (char& c : text) {
    const auto uc = static_cast<unsigned char>(c);
    if (uc < 0x80) {
      c = static_cast<char>(std::tolower(uc));
    }
  }
  return text;
}

// -----------------------------------------------------------------------------
// stripDigitGrouping(): drop ',' only when it sits between two digits
// -----------------------------------------------------------------------------
std::string stripDigitGrouping(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    const bool between_digits =
        text[i] == ',' && i > 0 && i + 1 < text.size() &&
        std::isdigit(static_cast<unsigned char>(text[i - 1])) &&
        std::isdigit(static_cast<unsigned char>(text[i + 1]));
    if (!between_digits) {
      out.push_back(text[i]);
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// extractPhoneNumber()
// -----------------------------------------------------------------------------
std::optional<std::string> extractPhoneNumber(const std::string& text) {
  std::string cleaned;
  cleaned.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text.compare(i, 3, "+91") == 0) {
      i += 2;
      continue;
    }
    if (text[i] == '-' || text[i] == ' ') {
      continue;
    }
    cleaned.push_back(text[i]);
  }

  // Spaces are already gone, so a figure typed after the number may touch
  // it ("9876543210 2 lakh" -> "98765432102lakh"); the first ten digits win.
  static const std::regex kPhone(R"((?:^|[^0-9])(?:91)?([0-9]{10}))");
  std::smatch match;
  if (std::regex_search(cleaned, match, kPhone)) {
    return match[1].str();
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// parseSalaryFigure()
// -----------------------------------------------------------------------------
std::optional<double> parseSalaryFigure(const std::string& text) {
  const std::string lowered = stripDigitGrouping(toLowerAscii(text));

  // Digit runs are bounded and anchored on a non-digit so a very long run
  // of digits is rejected in constant work per position.
  static const std::regex kLakh(
      R"((?:^|[^0-9])([0-9]{1,9}(?:\.[0-9]{1,4})?)\s{0,8}(?:lakhs?|lacs?|l)\b)");
  static const std::regex kThousand(
      R"((?:^|[^0-9])([0-9]{1,9}(?:\.[0-9]{1,4})?)\s{0,8}k\b)");
  static const std::regex kPlain(R"((?:^|[^0-9.])([0-9]{4,7})(?![0-9]))");

  std::smatch match;
  double value = 0.0;
  if (std::regex_search(lowered, match, kLakh)) {
    value = std::stod(match[1].str()) * 100000.0;
  } else if (std::regex_search(lowered, match, kThousand)) {
    value = std::stod(match[1].str()) * 1000.0;
  } else if (std::regex_search(lowered, match, kPlain)) {
    value = std::stod(match[1].str());
  }

  if (value <= 0.0) {
    return std::nullopt;
  }
  return value;
}

}  // namespace lendflow
