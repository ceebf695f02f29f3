// =============================================================================
// customer_directory_test.cpp
// =============================================================================
// Unit tests for lendflow::CustomerDirectory.
//
// Validates:
//   - Lookup by normalized phone and by customer id
//   - Not-found results carry a reason
//   - sampleBook() profiles and offer usability
//   - JSON parsing: optional offer, missing fields, bad files
// =============================================================================

#include "lendflow/collaborators/customer_directory.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

using lendflow::CustomerDirectory;
using lendflow::LookupStatus;

class CustomerDirectoryTest : public ::testing::Test {
 protected:
  CustomerDirectory directory{CustomerDirectory::sampleBook()};
};

// -----------------------------------------------------------------------------
// 1. Formatting variants of one number resolve to the same customer.
// -----------------------------------------------------------------------------
TEST_F(CustomerDirectoryTest, LookupByPhoneVariants) {
  for (const char* phone : {"9876543210", "+91 98765-43210", "919876543210",
                            "98765 43210"}) {
    auto result = directory.lookup(phone);
    ASSERT_TRUE(result.found()) << phone;
    EXPECT_EQ(result.customer->customer_id, "CUST001");
    EXPECT_EQ(result.customer->name, "Rahul Sharma");
  }
}

TEST_F(CustomerDirectoryTest, LookupByCustomerId) {
  auto result = directory.lookup("CUST003");
  ASSERT_TRUE(result.found());
  EXPECT_EQ(result.customer->phone, "9876543212");
}

TEST_F(CustomerDirectoryTest, UnknownPhoneIsNotFound) {
  auto result = directory.lookup("9999999999");
  EXPECT_EQ(result.status, LookupStatus::NotFound);
  EXPECT_FALSE(result.found());
  EXPECT_FALSE(result.hasUsableOffer());
  EXPECT_FALSE(result.kycVerified());
  EXPECT_FALSE(result.not_found_reason.empty());
}

// -----------------------------------------------------------------------------
// 2. The sample book covers the profiles the conversation flow branches on.
// -----------------------------------------------------------------------------
TEST_F(CustomerDirectoryTest, SampleBookProfiles) {
  EXPECT_EQ(directory.size(), 10u);

  auto premium = directory.lookup("9876543210");
  EXPECT_TRUE(premium.hasUsableOffer());
  EXPECT_TRUE(premium.kycVerified());

  auto no_offer = directory.lookup("9876543213");
  ASSERT_TRUE(no_offer.found());
  EXPECT_FALSE(no_offer.hasUsableOffer());
  EXPECT_LT(no_offer.customer->credit_score, 700);

  auto kyc_pending = directory.lookup("9876543214");
  ASSERT_TRUE(kyc_pending.found());
  EXPECT_FALSE(kyc_pending.kycVerified());
}

TEST_F(CustomerDirectoryTest, AddReplacesSamePhone) {
  auto record = *directory.lookup("CUST001").customer;
  record.credit_score = 701;
  record.phone = "+91 9876543210";
  directory.add(record);

  EXPECT_EQ(directory.size(), 10u);
  EXPECT_EQ(directory.lookup("9876543210").customer->credit_score, 701);
}

TEST_F(CustomerDirectoryTest, AddWithoutPhoneThrows) {
  lendflow::domain::CustomerRecord record;
  record.customer_id = "CUSTX";
  EXPECT_THROW(directory.add(record), std::invalid_argument);
}

TEST(CustomerDirectoryStaticTest, NormalizePhone) {
  EXPECT_EQ(CustomerDirectory::normalizePhone("+91-98765-43210"),
            "9876543210");
  EXPECT_EQ(CustomerDirectory::normalizePhone("919876543210"), "9876543210");
  EXPECT_EQ(CustomerDirectory::normalizePhone("9198765432"), "9198765432");
}

// =============================================================================
// JSON records
// =============================================================================

TEST(CustomerDirectoryStaticTest, ParseRecordsWithAndWithoutOffer) {
  auto doc = nlohmann::json::parse(R"([
    {"customer_id": "C1", "name": "A", "phone": "9000000001",
     "credit_score": 760, "kyc_verified": true, "monthly_salary": 50000,
     "offer": {"limit": 200000, "interest_rate": 12.0,
               "max_tenure_months": 36}},
    {"customer_id": "C2", "name": "B", "phone": "9000000002",
     "credit_score": 640, "offer": null}
  ])");

  auto records = CustomerDirectory::parseRecords(doc);
  ASSERT_EQ(records.size(), 2u);
  ASSERT_TRUE(records[0].offer.has_value());
  EXPECT_DOUBLE_EQ(records[0].offer->limit, 200000.0);
  EXPECT_EQ(records[0].offer->offer_type, "STANDARD");
  EXPECT_FALSE(records[1].offer.has_value());
  EXPECT_FALSE(records[1].kyc_verified);
}

TEST(CustomerDirectoryStaticTest, MalformedRecordsThrow) {
  EXPECT_THROW(CustomerDirectory::parseRecords(nlohmann::json::object()),
               std::runtime_error);
  EXPECT_THROW(CustomerDirectory::parseRecords(nlohmann::json::parse(
                   R"([{"customer_id": "C1", "name": "A"}])")),
               std::runtime_error);
}

// -----------------------------------------------------------------------------
// 3. loadFile() reads the shipped layout and reports unreadable files.
// -----------------------------------------------------------------------------
TEST(CustomerDirectoryStaticTest, LoadFile) {
  const std::string path = ::testing::TempDir() + "lendflow_customers.json";
  {
    std::ofstream out(path);
    out << R"([{"customer_id": "C9", "name": "Z", "phone": "9000000009",
               "credit_score": 800}])";
  }
  auto records = CustomerDirectory::loadFile(path);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].customer_id, "C9");
  std::remove(path.c_str());

  EXPECT_THROW(CustomerDirectory::loadFile(::testing::TempDir() +
                                           "lendflow_missing.json"),
               std::runtime_error);

  const std::string bad = ::testing::TempDir() + "lendflow_bad.json";
  {
    std::ofstream out(bad);
    out << "{ not json";
  }
  EXPECT_THROW(CustomerDirectory::loadFile(bad), std::runtime_error);
  std::remove(bad.c_str());
}
