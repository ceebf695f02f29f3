#pragma once

#include "lendflow/intent/intent.hpp"

#include <string>
#include <vector>

namespace lendflow {

// Which question the customer is answering.
enum class ReplyContext {
  OfferResponse,     // reply to the pre-approved offer / amount prompts
  DocumentResponse,  // reply to the income-proof request
};

// -----------------------------------------------------------------------------
// IntentClassifier — keyword-based reply classification
// -----------------------------------------------------------------------------
//
// @brief  Maps a raw customer message to an Intent for a given context.
//
// @details
// Decline phrases are matched as whole words on a normalized copy of the
// message (ASCII lower-cased, punctuation other than apostrophes replaced
// with spaces, whitespace collapsed). "no" therefore matches "No, thanks"
// but not "now" or "know".
//
// OfferResponse:
//   decline phrase                      → Decline
//   anything else                       → Extractable{message}
//
// DocumentResponse:
//   decline phrase                      → Decline
//   parsable salary figure              → Extractable{message}
//   upload signal without a figure      → Continue
//   anything else                       → Extractable{message}
//
// Default phrase lists:
//   offer:    no, not interested, decline, cancel, don't want, nevermind,
//             never mind, forget it
//   document: no, don't have, can't provide, later, not now
//   upload:   uploaded, attached, salary slip, payslip
//
// Thread model:
//   Immutable after construction; classify() is const and thread-safe.
// -----------------------------------------------------------------------------
class IntentClassifier {
 public:
  IntentClassifier();

  IntentClassifier(std::vector<std::string> offer_declines,
                   std::vector<std::string> document_declines,
                   std::vector<std::string> upload_signals);

  Intent classify(ReplyContext context, const std::string& message) const;

  // Lower-cased, punctuation-free, single-spaced, padded with one space on
  // each side so that " phrase " finds whole-word matches.
  static std::string normalize(const std::string& message);

 private:
  // Returns the first phrase found in the normalized text, or "".
  static std::string findPhrase(const std::string& normalized,
                                const std::vector<std::string>& phrases);

  std::vector<std::string> offer_declines_;
  std::vector<std::string> document_declines_;
  std::vector<std::string> upload_signals_;
};

}  // namespace lendflow
