#pragma once

#include <optional>
#include <string>

namespace lendflow {

// Terms of an approved loan, as handed to the document generator.
struct SanctionRequest {
  std::string conversation_id;
  std::string customer_id;
  std::string customer_name;
  std::string phone;
  double loan_amount{0.0};
  int tenure_months{0};
  double interest_rate{0.0};
  double emi{0.0};
  std::optional<std::string> purpose;
};

// -----------------------------------------------------------------------------
// DocumentResult
// -----------------------------------------------------------------------------
//
// @details
// document_id is the sanction reference and is meaningful only when
// success is true. location is where the rendered letter was stored, empty
// when the generator does not persist documents. error carries a short
// description when success is false.
// -----------------------------------------------------------------------------
struct DocumentResult {
  bool success{false};
  std::string document_id;
  std::string location;
  std::string error;
};

// -----------------------------------------------------------------------------
// IDocumentGenerator — sanction letter production
// -----------------------------------------------------------------------------
//
// @brief  Produces the sanction document for an approved loan.
//
// @details
// A generator that cannot produce the document reports success == false;
// the loan is still sanctioned and the orchestrator records that no
// document is available. Throwing is reserved for faults.
//
// Thread model:
//   Shared across conversations; generateDocument() must be safe to call
//   concurrently.
// -----------------------------------------------------------------------------
class IDocumentGenerator {
 public:
  virtual ~IDocumentGenerator() = default;

  virtual DocumentResult generateDocument(const SanctionRequest& request) = 0;
};

}  // namespace lendflow
