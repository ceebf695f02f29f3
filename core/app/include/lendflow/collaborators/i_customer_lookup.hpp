#pragma once

#include "lendflow/domain/customer.hpp"

#include <optional>
#include <string>

namespace lendflow {

enum class LookupStatus {
  Found,
  NotFound,
};

// -----------------------------------------------------------------------------
// LookupResult — answer from the CRM / KYC / offer store
// -----------------------------------------------------------------------------
//
// @details
// The three business outcomes the orchestrator branches on are kept
// distinguishable:
//
//   no record       status == NotFound, not_found_reason explains why
//   ineligible      Found, but no usable offer (or a sub-floor score)
//   KYC pending     Found, customer->kyc_verified == false
//
// None of these are errors; a lookup that cannot be performed at all
// (backend down, corrupt data) throws instead.
// -----------------------------------------------------------------------------
struct LookupResult {
  LookupStatus status{LookupStatus::NotFound};
  std::optional<domain::CustomerRecord> customer;
  std::string not_found_reason;

  bool found() const {
    return status == LookupStatus::Found && customer.has_value();
  }

  bool hasUsableOffer() const {
    return found() && customer->offer.has_value() && customer->offer->usable();
  }

  bool kycVerified() const { return found() && customer->kyc_verified; }
};

// -----------------------------------------------------------------------------
// ICustomerLookup — customer / KYC / pre-approved offer lookup
// -----------------------------------------------------------------------------
//
// @brief  Resolves a phone number (or customer id) to the customer's CRM
//         record, bureau score and standing offer.
//
// @details
// Called by the ConversationOrchestrator twice per conversation at most:
// once during need discovery (uncounted) and once for KYC verification
// (counted by the CallGuard).
//
// Error contract:
//   Business outcomes are returned in LookupResult. Infrastructure failures
//   are reported by throwing a std::exception-derived type; the
//   orchestrator converts them into a dropped conversation.
//
// Thread model:
//   One implementation instance is shared by every conversation, so
//   lookup() must be safe to call concurrently from multiple threads.
//
// Ownership:
//   Not owned by the orchestrator. The caller (main() or a test fixture)
//   keeps it alive for as long as any conversation exists.
// -----------------------------------------------------------------------------
class ICustomerLookup {
 public:
  virtual ~ICustomerLookup() = default;

  virtual LookupResult lookup(const std::string& phone_or_id) = 0;
};

}  // namespace lendflow
