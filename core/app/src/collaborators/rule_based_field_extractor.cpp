#include "lendflow/collaborators/rule_based_field_extractor.hpp"

#include "lendflow/intent/text_parsers.hpp"

#include <cctype>
#include <cmath>
#include <regex>
#include <sstream>

namespace lendflow {

namespace {

constexpr std::size_t kMaxPlainAmountDigits = 8;
constexpr std::size_t kMaxPurposeWords = 4;
constexpr int kMaxBareTenureMonths = 600;

bool containsDigit(const std::string& word) {
  for (char c : word) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
      return true;
    }
  }
  return false;
}

}  // namespace

// -----------------------------------------------------------------------------
// extractFields()
// -----------------------------------------------------------------------------
ExtractedFields RuleBasedFieldExtractor::extractFields(
    const std::string& message,
    const std::vector<domain::ChatMessage>& context) {
  ExtractedFields fields;
  fields.requested_amount = parseAmount(message);
  fields.tenure_months = parseTenure(message);
  fields.purpose = parsePurpose(message);

  // A bare "36" only means something relative to the question just asked.
  static const std::regex kBareNumber(R"(\s{0,8}([0-9]{1,3})\s{0,8})");
  std::smatch match;
  if (!fields.tenure_months && std::regex_match(message, match, kBareNumber) &&
      lastPromptAskedForTenure(context)) {
    const int months = std::stoi(match[1].str());
    if (months > 0 && months <= kMaxBareTenureMonths) {
      fields.tenure_months = months;
    }
  }
  return fields;
}

// -----------------------------------------------------------------------------
// parseAmount(): unit words first, then a plain number
// -----------------------------------------------------------------------------
std::optional<double> RuleBasedFieldExtractor::parseAmount(
    const std::string& message) {
  const std::string text = stripDigitGrouping(toLowerAscii(message));

  static const std::regex kCrore(
      R"((?:^|[^0-9])([0-9]{1,9}(?:\.[0-9]{1,4})?)\s{0,8}(?:crores?|cr)\b)");
  static const std::regex kLakh(
      R"((?:^|[^0-9])([0-9]{1,9}(?:\.[0-9]{1,4})?)\s{0,8}(?:lakhs?|lacs?|l)\b)");
  static const std::regex kThousand(
      R"((?:^|[^0-9])([0-9]{1,9}(?:\.[0-9]{1,4})?)\s{0,8}(?:k|thousand)\b)");

  std::smatch match;
  if (std::regex_search(text, match, kCrore)) {
    return std::stod(match[1].str()) * 10000000.0;
  }
  if (std::regex_search(text, match, kLakh)) {
    return std::stod(match[1].str()) * 100000.0;
  }
  if (std::regex_search(text, match, kThousand)) {
    return std::stod(match[1].str()) * 1000.0;
  }

  // Runs longer than nine digits never match, not even in part.
  static const std::regex kNumber(
      R"((?:^|[^0-9])([0-9]{1,9}(?:\.[0-9]{1,9})?)(?![0-9]))");
  static const std::regex kTenureUnit(
      R"(^\s{0,8}(?:months?|mos?|mths?|years?|yrs?)\b)");

  for (auto it = std::sregex_iterator(text.begin(), text.end(), kNumber);
       it != std::sregex_iterator(); ++it) {
    const std::string number = (*it)[1].str();
    const std::string integer_part = number.substr(0, number.find('.'));
    if (integer_part.size() < 4 || integer_part.size() > kMaxPlainAmountDigits) {
      continue;
    }
    if (std::regex_search(it->suffix().first, it->suffix().second,
                          kTenureUnit,
                          std::regex_constants::match_continuous)) {
      continue;
    }
    const double value = std::stod(number);
    if (value > 0.0) {
      return value;
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// parseTenure()
// -----------------------------------------------------------------------------
std::optional<int> RuleBasedFieldExtractor::parseTenure(
    const std::string& message) {
  const std::string text = toLowerAscii(message);

  static const std::regex kMonths(
      R"((?:^|[^0-9])([0-9]{1,4}(?:\.[0-9]{1,2})?)\s{0,8}(?:months?|mos?|mths?)\b)");
  static const std::regex kYears(
      R"((?:^|[^0-9])([0-9]{1,3}(?:\.[0-9]{1,2})?)\s{0,8}(?:years?|yrs?)\b)");

  std::smatch match;
  double months = 0.0;
  if (std::regex_search(text, match, kMonths)) {
    months = std::stod(match[1].str());
  } else if (std::regex_search(text, match, kYears)) {
    months = std::stod(match[1].str()) * 12.0;
  }

  const int rounded = static_cast<int>(std::lround(months));
  if (rounded <= 0) {
    return std::nullopt;
  }
  return rounded;
}

// -----------------------------------------------------------------------------
// parsePurpose(): words after "for", stopping at punctuation or a number
// -----------------------------------------------------------------------------
std::optional<std::string> RuleBasedFieldExtractor::parsePurpose(
    const std::string& message) {
  const std::string text = " " + toLowerAscii(message);
  const auto pos = text.find(" for ");
  if (pos == std::string::npos) {
    return std::nullopt;
  }

  std::string rest = text.substr(pos + 5);
  const auto cut = rest.find_first_of(".,!?;\n");
  if (cut != std::string::npos) {
    rest.erase(cut);
  }

  std::istringstream words(rest);
  std::string word;
  std::string purpose;
  std::size_t count = 0;
  bool leading = true;
  while (words >> word && count < kMaxPurposeWords) {
    if (leading && (word == "a" || word == "an" || word == "my" ||
                    word == "the")) {
      continue;
    }
    leading = false;
    const bool stop = containsDigit(word) ||
                      static_cast<unsigned char>(word.front()) >= 0x80 ||
                      word == "rs" || word == "inr" || word == "over" ||
                      word == "in" || word == "within" || word == "with";
    if (stop) {
      break;
    }
    if (!purpose.empty()) {
      purpose.push_back(' ');
    }
    purpose += word;
    ++count;
  }

  if (purpose.empty()) {
    return std::nullopt;
  }
  return purpose;
}

// -----------------------------------------------------------------------------
// lastPromptAskedForTenure()
// -----------------------------------------------------------------------------
bool RuleBasedFieldExtractor::lastPromptAskedForTenure(
    const std::vector<domain::ChatMessage>& context) {
  for (auto it = context.rbegin(); it != context.rend(); ++it) {
    if (it->speaker == domain::Speaker::Assistant) {
      const std::string prompt = toLowerAscii(it->text);
      return prompt.find("how many months") != std::string::npos ||
             prompt.find("tenure") != std::string::npos;
    }
  }
  return false;
}

}  // namespace lendflow
