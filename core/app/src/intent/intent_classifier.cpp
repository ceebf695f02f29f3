#include "lendflow/intent/intent_classifier.hpp"

#include "lendflow/intent/text_parsers.hpp"

#include <cctype>
#include <utility>

namespace lendflow {

// -----------------------------------------------------------------------------
// Default constructor: house phrase lists
// -----------------------------------------------------------------------------
IntentClassifier::IntentClassifier()
    : IntentClassifier(
          {"no", "not interested", "decline", "cancel", "don't want",
           "nevermind", "never mind", "forget it"},
          {"no", "don't have", "can't provide", "later", "not now"},
          {"uploaded", "attached", "salary slip", "payslip"}) {}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
IntentClassifier::IntentClassifier(std::vector<std::string> offer_declines,
                                   std::vector<std::string> document_declines,
                                   std::vector<std::string> upload_signals)
    : offer_declines_(std::move(offer_declines)),
      document_declines_(std::move(document_declines)),
      upload_signals_(std::move(upload_signals)) {}

// -----------------------------------------------------------------------------
// classify()
// -----------------------------------------------------------------------------
Intent IntentClassifier::classify(ReplyContext context,
                                  const std::string& message) const {
  const std::string normalized = normalize(message);

  if (context == ReplyContext::OfferResponse) {
    std::string phrase = findPhrase(normalized, offer_declines_);
    if (!phrase.empty()) {
      return Decline{std::move(phrase)};
    }
    return Extractable{message};
  }

  std::string phrase = findPhrase(normalized, document_declines_);
  if (!phrase.empty()) {
    return Decline{std::move(phrase)};
  }
  if (parseSalaryFigure(message)) {
    return Extractable{message};
  }
  if (!findPhrase(normalized, upload_signals_).empty()) {
    return Continue{};
  }
  return Extractable{message};
}

// -----------------------------------------------------------------------------
// normalize()
// -----------------------------------------------------------------------------
std::string IntentClassifier::normalize(const std::string& message) {
  // U+2019 (right single quotation mark) is folded to an ASCII apostrophe.
  static const std::string kCurlyApostrophe = "\xE2\x80\x99";
  std::string text = toLowerAscii(message);
  for (auto pos = text.find(kCurlyApostrophe); pos != std::string::npos;
       pos = text.find(kCurlyApostrophe, pos + 1)) {
    text.replace(pos, kCurlyApostrophe.size(), "'");
  }

  std::string out = " ";
  for (char c : text) {
    const auto uc = static_cast<unsigned char>(c);
    const bool keep = std::isalnum(uc) || c == '\'';
    if (keep) {
      out.push_back(c);
    } else if (out.back() != ' ') {
      out.push_back(' ');
    }
  }
  if (out.back() != ' ') {
    out.push_back(' ');
  }
  return out;
}

// -----------------------------------------------------------------------------
// findPhrase()
// -----------------------------------------------------------------------------
std::string IntentClassifier::findPhrase(
    const std::string& normalized, const std::vector<std::string>& phrases) {
  for (const auto& phrase : phrases) {
    if (normalized.find(" " + phrase + " ") != std::string::npos) {
      return phrase;
    }
  }
  return {};
}

}  // namespace lendflow
