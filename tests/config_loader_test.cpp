// =============================================================================
// config_loader_test.cpp
// =============================================================================
// Unit tests for lendflow::ConfigLoader.
//
// Validates:
//   - Defaults for an empty document
//   - Every section overrides its fields
//   - auto_continue merges stage by stage
//   - Type, range and stage-name errors are reported as runtime_error
// =============================================================================

#include "lendflow/config/config_loader.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

using lendflow::ConfigLoader;
using lendflow::domain::Stage;
using nlohmann::json;

TEST(ConfigLoaderTest, EmptyDocumentKeepsDefaults) {
  auto config = ConfigLoader::fromJson(json::object());

  EXPECT_EQ(config.underwriting.min_credit_score, 700);
  EXPECT_DOUBLE_EQ(config.underwriting.max_emi_to_salary_ratio, 0.5);
  EXPECT_DOUBLE_EQ(config.underwriting.stretch_multiplier, 2.0);
  EXPECT_EQ(config.underwriting.default_tenure_months, 12);
  EXPECT_EQ(config.conversation.max_agent_calls, 6);
  EXPECT_EQ(config.conversation.extraction_context_messages, 4u);
  EXPECT_EQ(config.conversation.max_message_chars, 2000u);
  EXPECT_EQ(config.max_archived_conversations, 1000u);
  EXPECT_TRUE(config.conversation.autoContinues(Stage::KycVerification));
  EXPECT_FALSE(config.conversation.autoContinues(Stage::OfferPresentation));
  EXPECT_EQ(config.command_endpoint, "tcp://127.0.0.1:5556");
  EXPECT_TRUE(config.customers_file.empty());
}

TEST(ConfigLoaderTest, SectionsOverrideDefaults) {
  auto doc = json::parse(R"({
    "underwriting": {"min_credit_score": 720, "max_emi_to_salary_ratio": 0.4,
                     "stretch_multiplier": 1.5, "default_tenure_months": 24},
    "conversation": {"max_agent_calls": 8, "extraction_context_messages": 6,
                     "max_message_chars": 500},
    "network": {"command_endpoint": "ipc:///tmp/lf-cmd",
                "telemetry_endpoint": ""},
    "data": {"customers_file": "book.json", "sanction_output_dir": "out",
             "max_archived_conversations": 50}
  })");

  auto config = ConfigLoader::fromJson(doc);

  EXPECT_EQ(config.underwriting.min_credit_score, 720);
  EXPECT_DOUBLE_EQ(config.underwriting.max_emi_to_salary_ratio, 0.4);
  EXPECT_DOUBLE_EQ(config.underwriting.stretch_multiplier, 1.5);
  EXPECT_EQ(config.underwriting.default_tenure_months, 24);
  EXPECT_EQ(config.conversation.max_agent_calls, 8);
  EXPECT_EQ(config.conversation.extraction_context_messages, 6u);
  EXPECT_EQ(config.command_endpoint, "ipc:///tmp/lf-cmd");
  EXPECT_TRUE(config.telemetry_endpoint.empty());
  EXPECT_EQ(config.customers_file, "book.json");
  EXPECT_EQ(config.sanction_output_dir, "out");
  EXPECT_EQ(config.conversation.max_message_chars, 500u);
  EXPECT_EQ(config.max_archived_conversations, 50u);
}

// -----------------------------------------------------------------------------
// 1. auto_continue entries replace only the stages they name.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, AutoContinueMergesPerStage) {
  auto doc = json::parse(R"({
    "conversation": {"auto_continue": {"KYC_VERIFICATION": false,
                                       "OFFER_PRESENTATION": true}}
  })");

  auto config = ConfigLoader::fromJson(doc);

  EXPECT_FALSE(config.conversation.autoContinues(Stage::KycVerification));
  EXPECT_TRUE(config.conversation.autoContinues(Stage::OfferPresentation));
  EXPECT_TRUE(config.conversation.autoContinues(Stage::Underwriting));
  EXPECT_TRUE(config.conversation.autoContinues(Stage::Sanction));
}

TEST(ConfigLoaderTest, InvalidValuesThrow) {
  EXPECT_THROW(ConfigLoader::fromJson(json::array()), std::runtime_error);
  EXPECT_THROW(ConfigLoader::fromJson(json::parse(
                   R"({"underwriting": {"min_credit_score": "high"}})")),
               std::runtime_error);
  EXPECT_THROW(ConfigLoader::fromJson(json::parse(
                   R"({"underwriting": {"max_emi_to_salary_ratio": 1.5}})")),
               std::runtime_error);
  EXPECT_THROW(ConfigLoader::fromJson(json::parse(
                   R"({"underwriting": {"stretch_multiplier": 0.5}})")),
               std::runtime_error);
  EXPECT_THROW(ConfigLoader::fromJson(json::parse(
                   R"({"conversation": {"max_agent_calls": 0}})")),
               std::runtime_error);
  EXPECT_THROW(ConfigLoader::fromJson(json::parse(
                   R"({"conversation": {"auto_continue": {"PAYMENT": true}}})")),
               std::runtime_error);
  EXPECT_THROW(ConfigLoader::fromJson(json::parse(
                   R"({"conversation": {"max_message_chars": 0}})")),
               std::runtime_error);
  EXPECT_THROW(ConfigLoader::fromJson(json::parse(
                   R"({"data": {"max_archived_conversations": 0}})")),
               std::runtime_error);
  EXPECT_THROW(ConfigLoader::fromJson(json::parse(R"({"network": 5})")),
               std::runtime_error);
}

TEST(ConfigLoaderTest, LoadFileReadsAndReportsErrors) {
  const std::string path = ::testing::TempDir() + "lendflow_config.json";
  {
    std::ofstream out(path);
    out << R"({"conversation": {"max_agent_calls": 3}})";
  }
  EXPECT_EQ(ConfigLoader::loadFile(path).conversation.max_agent_calls, 3);
  std::remove(path.c_str());

  EXPECT_THROW(ConfigLoader::loadFile(::testing::TempDir() +
                                      "lendflow_no_such_config.json"),
               std::runtime_error);
}
