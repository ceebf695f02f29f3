#pragma once

#include "lendflow/collaborators/i_document_generator.hpp"
#include "lendflow/concurrent/sequence_generator.hpp"
#include "lendflow/time/i_time_provider.hpp"

#include <cstdint>
#include <string>

namespace lendflow {

// -----------------------------------------------------------------------------
// SanctionDocumentGenerator — plain-text sanction letter issuer
// -----------------------------------------------------------------------------
//
// @brief  Issues a sanction reference for an approved loan and renders the
//         sanction letter, optionally writing it to disk.
//
// @details
// Reference format:
//
//   LF-<yyyymmddHHMMSS>-<6 uppercase hex>
//
// The timestamp is the injected clock's now_ms() in UTC. The hex suffix is
// derived from the conversation id and a per-generator sequence number, so
// two letters issued in the same second still differ.
//
// When output_dir is non-empty the letter is written to
// "<output_dir>/<reference>.txt". A write failure is reported as
// success == false (the loan stays sanctioned); it is not thrown.
//
// Thread model:
//   generateDocument() may be called concurrently; the sequence generator
//   is atomic and each call writes its own file.
//
// Ownership:
//   Holds a const reference to the time provider, which must outlive it.
// -----------------------------------------------------------------------------
class SanctionDocumentGenerator final : public IDocumentGenerator {
 public:
  explicit SanctionDocumentGenerator(const ITimeProvider& clock,
                                     std::string output_dir = "");

  DocumentResult generateDocument(const SanctionRequest& request) override;

  // Sanction reference for the given inputs.
  static std::string makeReference(std::int64_t issued_ms,
                                   const std::string& conversation_id,
                                   std::uint64_t sequence);

  // Full letter text.
  static std::string renderLetter(const SanctionRequest& request,
                                  const std::string& reference,
                                  std::int64_t issued_ms);

 private:
  const ITimeProvider& clock_;
  std::string output_dir_;
  SequenceGenerator sequence_;
};

}  // namespace lendflow
