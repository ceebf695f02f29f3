#pragma once

#include "lendflow/collaborators/i_field_extractor.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lendflow {

// -----------------------------------------------------------------------------
// RuleBasedFieldExtractor — pattern-based IFieldExtractor
// -----------------------------------------------------------------------------
//
// @brief  Reads amount, tenure and purpose from a message with a handful of
//         regular expressions.
//
// @details
// Recognised shapes:
//
//   amount   "5 lakh", "2.5 lakhs", "1 crore", "50k", "₹300000",
//            "rs 3,00,000", any number of 4+ digits not followed by a
//            tenure unit
//   tenure   "36 months", "24 mo", "3 years", "1.5 yrs"
//   purpose  the words after "for" up to punctuation or a number,
//            e.g. "for home renovation" → "home renovation"
//
// A message that is only a number is resolved against the last assistant
// prompt in the context window: after a "how many months" question it is a
// tenure, otherwise a value of 1000 or more is an amount. Nothing is
// returned for fields the message does not contain.
//
// Thread model:
//   Stateless apart from compiled patterns; extractFields() is safe to call
//   concurrently.
// -----------------------------------------------------------------------------
class RuleBasedFieldExtractor final : public IFieldExtractor {
 public:
  ExtractedFields extractFields(
      const std::string& message,
      const std::vector<domain::ChatMessage>& context) override;

  static std::optional<double> parseAmount(const std::string& message);
  static std::optional<int> parseTenure(const std::string& message);
  static std::optional<std::string> parsePurpose(const std::string& message);

 private:
  static bool lastPromptAskedForTenure(
      const std::vector<domain::ChatMessage>& context);
};

}  // namespace lendflow
