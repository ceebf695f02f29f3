// =============================================================================
// sanction_document_generator_test.cpp
// =============================================================================
// Unit tests for lendflow::SanctionDocumentGenerator.
//
// Validates:
//   - Reference format LF-<yyyymmddHHMMSS>-<6 hex> in UTC
//   - Distinct references for letters issued in the same second
//   - Letter content
//   - In-memory mode, file output, and unwritable directories
// =============================================================================

#include "lendflow/collaborators/sanction_document_generator.hpp"
#include "lendflow/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

using lendflow::SanctionDocumentGenerator;
using lendflow::SanctionRequest;

namespace {

// 2024-06-15 12:30:00 UTC
constexpr std::int64_t kIssuedMs = 1718454600000LL;

SanctionRequest sampleRequest() {
  SanctionRequest r;
  r.conversation_id = "conv-1";
  r.customer_id = "CUST001";
  r.customer_name = "Rahul Sharma";
  r.phone = "9876543210";
  r.loan_amount = 300000.0;
  r.tenure_months = 36;
  r.interest_rate = 12.5;
  r.emi = 10036.09;
  return r;
}

}  // namespace

class SanctionDocumentGeneratorTest : public ::testing::Test {
 protected:
  lendflow::SimulationTimeProvider clock{kIssuedMs};
};

// -----------------------------------------------------------------------------
// 1. Reference layout.
// -----------------------------------------------------------------------------
TEST_F(SanctionDocumentGeneratorTest, ReferenceFormat) {
  const std::string ref =
      SanctionDocumentGenerator::makeReference(kIssuedMs, "conv-1", 1);

  ASSERT_EQ(ref.size(), 24u);
  EXPECT_EQ(ref.substr(0, 18), "LF-20240615123000-");
  EXPECT_EQ(ref.substr(18).find_first_not_of("0123456789ABCDEF"),
            std::string::npos);
}

// -----------------------------------------------------------------------------
// 2. Same second, different sequence or conversation: different reference.
// -----------------------------------------------------------------------------
TEST_F(SanctionDocumentGeneratorTest, ReferencesDifferWithinOneSecond) {
  SanctionDocumentGenerator generator(clock);

  auto first = generator.generateDocument(sampleRequest());
  auto second = generator.generateDocument(sampleRequest());

  ASSERT_TRUE(first.success);
  ASSERT_TRUE(second.success);
  EXPECT_NE(first.document_id, second.document_id);
  EXPECT_EQ(SanctionDocumentGenerator::makeReference(kIssuedMs, "a", 7),
            SanctionDocumentGenerator::makeReference(kIssuedMs, "a", 7));
}

// -----------------------------------------------------------------------------
// 3. Without an output directory the letter is only issued, not stored.
// -----------------------------------------------------------------------------
TEST_F(SanctionDocumentGeneratorTest, InMemoryModeSucceedsWithoutLocation) {
  SanctionDocumentGenerator generator(clock);
  auto result = generator.generateDocument(sampleRequest());

  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.location.empty());
  EXPECT_EQ(result.document_id.rfind("LF-20240615123000-", 0), 0u);
}

TEST_F(SanctionDocumentGeneratorTest, LetterContent) {
  auto request = sampleRequest();
  request.purpose = "home renovation";
  const std::string letter = SanctionDocumentGenerator::renderLetter(
      request, "LF-20240615123000-ABCDEF", kIssuedMs);

  EXPECT_NE(letter.find("Sanction ID: LF-20240615123000-ABCDEF"),
            std::string::npos);
  EXPECT_NE(letter.find("Date: June 15, 2024"), std::string::npos);
  EXPECT_NE(letter.find("Dear Rahul Sharma"), std::string::npos);
  EXPECT_NE(letter.find("\xE2\x82\xB9" "300,000.00"), std::string::npos);
  EXPECT_NE(letter.find("\xE2\x82\xB9" "10,036.09"), std::string::npos);
  EXPECT_NE(letter.find("36 months"), std::string::npos);
  EXPECT_NE(letter.find("Purpose:           home renovation"),
            std::string::npos);
}

// -----------------------------------------------------------------------------
// 4. With an output directory the letter lands in <dir>/<reference>.txt.
// -----------------------------------------------------------------------------
TEST_F(SanctionDocumentGeneratorTest, WritesLetterToOutputDirectory) {
  SanctionDocumentGenerator generator(clock, ::testing::TempDir());
  auto result = generator.generateDocument(sampleRequest());

  ASSERT_TRUE(result.success) << result.error;
  ASSERT_FALSE(result.location.empty());

  std::ifstream in(result.location);
  ASSERT_TRUE(in.is_open());
  std::stringstream content;
  content << in.rdbuf();
  EXPECT_NE(content.str().find(result.document_id), std::string::npos);

  in.close();
  std::remove(result.location.c_str());
}

// -----------------------------------------------------------------------------
// 5. An unwritable directory is reported as a failed result, not thrown.
// Why: A missing letter must not undo a sanction already decided.
// -----------------------------------------------------------------------------
TEST_F(SanctionDocumentGeneratorTest, UnwritableDirectoryReportsFailure) {
  SanctionDocumentGenerator generator(clock,
                                      "/nonexistent/lendflow/sanctions");
  auto result = generator.generateDocument(sampleRequest());

  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.error.empty());
  EXPECT_TRUE(result.location.empty());
}
