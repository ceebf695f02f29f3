#pragma once

#include "lendflow/domain/conversation_state.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lendflow {

// Fields read out of one customer message. Unset means "not mentioned".
struct ExtractedFields {
  std::optional<double> requested_amount;
  std::optional<int> tenure_months;
  std::optional<std::string> purpose;
};

// -----------------------------------------------------------------------------
// IFieldExtractor — free text to loan request fields
// -----------------------------------------------------------------------------
//
// @brief  Best-effort extraction of amount, tenure and purpose from a
//         customer message.
//
// @details
// context holds the most recent transcript entries (oldest first) so an
// implementation can resolve replies such as "36 months" to the question
// that was asked. It must never return a value that is not present in the
// message itself.
//
// Error contract:
//   Returns an empty ExtractedFields when nothing is found. Throws a
//   std::exception-derived type only when extraction could not run.
//
// Thread model:
//   Shared across conversations; extractFields() must be safe to call
//   concurrently.
// -----------------------------------------------------------------------------
class IFieldExtractor {
 public:
  virtual ~IFieldExtractor() = default;

  virtual ExtractedFields extractFields(
      const std::string& message,
      const std::vector<domain::ChatMessage>& context) = 0;
};

}  // namespace lendflow
