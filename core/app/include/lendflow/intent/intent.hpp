#pragma once

#include <string>
#include <variant>

namespace lendflow {

// -----------------------------------------------------------------------------
// Intent — what a customer reply means to the state machine
// -----------------------------------------------------------------------------
//
// @details
// Decline      the customer is backing out ("no", "not interested").
// Continue     the customer is going along without giving new data, e.g.
//              "I've uploaded the salary slip".
// Extractable  the message should be mined for fields; carries the text.
//
// The orchestrator dispatches with std::get_if / std::holds_alternative and
// never inspects the raw text for these decisions itself.
// -----------------------------------------------------------------------------
struct Decline {
  std::string matched_phrase;
};

struct Continue {};

struct Extractable {
  std::string text;
};

using Intent = std::variant<Decline, Continue, Extractable>;

}  // namespace lendflow
