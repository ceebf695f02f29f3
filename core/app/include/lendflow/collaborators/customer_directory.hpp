#pragma once

#include "lendflow/collaborators/i_customer_lookup.hpp"
#include "lendflow/domain/customer.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace lendflow {

// -----------------------------------------------------------------------------
// CustomerDirectory — in-memory CRM, bureau and offer book
// -----------------------------------------------------------------------------
//
// @brief  ICustomerLookup backed by a map of customer records keyed by
//         normalized phone number, with a secondary index on customer id.
//
// @details
// Stands in for the CRM / credit bureau / offer-mart services. Records come
// either from sampleBook() (ten built-in customers covering approved,
// sub-floor score, KYC-pending and no-offer profiles) or from a JSON file:
//
//   [
//     {
//       "customer_id": "CUST001", "name": "Rahul Sharma",
//       "phone": "9876543210", "pan_number": "ABCDE1234F",
//       "city": "New Delhi", "credit_score": 780, "kyc_verified": true,
//       "monthly_salary": 85000, "employer": "TCS",
//       "offer": { "limit": 500000, "interest_rate": 12.5,
//                  "max_tenure_months": 60, "offer_type": "PREMIUM" }
//     }
//   ]
//
// "offer" may be omitted or null for a customer without a standing offer.
//
// Phone normalization strips spaces, dashes, a "+91" prefix and a "91"
// prefix on 12 digit numbers, so "+91 98765-43210" and "919876543210" both
// resolve to "9876543210".
//
// Thread model:
//   lookup() takes a shared lock; add() takes an exclusive lock. Safe to
//   share one directory between every conversation.
// -----------------------------------------------------------------------------
class CustomerDirectory final : public ICustomerLookup {
 public:
  CustomerDirectory() = default;
  explicit CustomerDirectory(const std::vector<domain::CustomerRecord>& records);

  CustomerDirectory(const CustomerDirectory&) = delete;
  CustomerDirectory& operator=(const CustomerDirectory&) = delete;

  LookupResult lookup(const std::string& phone_or_id) override;

  // Inserts or replaces the record with the same normalized phone.
  void add(domain::CustomerRecord record);

  std::size_t size() const;

  static std::string normalizePhone(const std::string& phone);

  // The ten built-in demo customers.
  static std::vector<domain::CustomerRecord> sampleBook();

  // -------------------------------------------------------------------------
  // loadFile(path) / parseRecords(json)
  // -------------------------------------------------------------------------
  // @brief  Reads customer records from the JSON layout shown above.
  //
  // @throws std::runtime_error if the file cannot be opened, is not valid
  //         JSON, or a record is missing a required field.
  // -------------------------------------------------------------------------
  static std::vector<domain::CustomerRecord> loadFile(const std::string& path);
  static std::vector<domain::CustomerRecord> parseRecords(
      const nlohmann::json& doc);

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, domain::CustomerRecord> by_phone_;
  std::unordered_map<std::string, std::string> phone_by_id_;
};

}  // namespace lendflow
