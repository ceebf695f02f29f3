// =============================================================================
// ipc_telemetry_format_test.cpp
// =============================================================================
// Unit tests for lendflow::IpcServer::formatTelemetry().
//
// Validates:
//   - Every event type becomes one JSON object with a "type" tag
//   - Common fields: conversation_id, timestamp_ms, sequence_id
//   - Optional fields are null when absent
//
// No sockets are opened; formatTelemetry() is a pure function.
// =============================================================================

#include "lendflow/network/ipc_server.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

using lendflow::IpcServer;
using nlohmann::json;

namespace {

constexpr std::int64_t kNowMs = 1718454600000LL;

json formatted(const lendflow::Event& event) {
  std::optional<std::string> text = IpcServer::formatTelemetry(event);
  EXPECT_TRUE(text.has_value());
  return text ? json::parse(*text) : json{};
}

}  // namespace

TEST(IpcTelemetryFormatTest, StageTransition) {
  lendflow::StageTransitionEvent e;
  e.conversation_id = "c1";
  e.from = lendflow::domain::Stage::OfferPresentation;
  e.to = lendflow::domain::Stage::KycVerification;
  e.timestamp = lendflow::ms_to_timestamp(kNowMs);
  e.sequence_id = 3;

  json j = formatted(e);
  EXPECT_EQ(j["type"], "stage_transition");
  EXPECT_EQ(j["conversation_id"], "c1");
  EXPECT_EQ(j["from"], "OFFER_PRESENTATION");
  EXPECT_EQ(j["to"], "KYC_VERIFICATION");
  EXPECT_EQ(j["timestamp_ms"].get<std::int64_t>(), kNowMs);
  EXPECT_EQ(j["sequence_id"].get<std::uint64_t>(), 3u);
}

// -----------------------------------------------------------------------------
// 1. A decision without an EMI carries "emi": null, not a zero.
// Why: A zero EMI would read as a free loan to a dashboard.
// -----------------------------------------------------------------------------
TEST(IpcTelemetryFormatTest, UnderwritingDecisionWithAndWithoutEmi) {
  lendflow::UnderwritingDecisionEvent e;
  e.conversation_id = "c2";
  e.decision = lendflow::domain::Decision::Rejected;
  e.requested_amount = 900000.0;
  e.reason = "above ceiling";

  json j = formatted(e);
  EXPECT_EQ(j["type"], "underwriting_decision");
  EXPECT_EQ(j["decision"], "REJECTED");
  EXPECT_DOUBLE_EQ(j["requested_amount"].get<double>(), 900000.0);
  EXPECT_TRUE(j["emi"].is_null());
  EXPECT_EQ(j["reason"], "above ceiling");

  e.decision = lendflow::domain::Decision::Approved;
  e.emi = 10036.09;
  j = formatted(e);
  EXPECT_EQ(j["decision"], "APPROVED");
  EXPECT_DOUBLE_EQ(j["emi"].get<double>(), 10036.09);
}

TEST(IpcTelemetryFormatTest, SafeguardTrip) {
  lendflow::SafeguardTripEvent e;
  e.conversation_id = "c3";
  e.agent_name = "FIELD_EXTRACTOR";
  e.verdict = lendflow::GuardVerdict::DuplicateCall;
  e.total_calls = 2;

  json j = formatted(e);
  EXPECT_EQ(j["type"], "safeguard_trip");
  EXPECT_EQ(j["agent"], "FIELD_EXTRACTOR");
  EXPECT_EQ(j["verdict"], "DUPLICATE_CALL");
  EXPECT_EQ(j["total_calls"], 2);
}

TEST(IpcTelemetryFormatTest, ConversationClosed) {
  lendflow::ConversationClosedEvent e;
  e.conversation_id = "c4";
  e.terminal_state = lendflow::domain::TerminalState::LoanSanctioned;
  e.sanction_id = "LF-20240615123000-ABCDEF";

  json j = formatted(e);
  EXPECT_EQ(j["type"], "conversation_closed");
  EXPECT_EQ(j["terminal_state"], "LOAN_SANCTIONED");
  EXPECT_EQ(j["sanction_id"], "LF-20240615123000-ABCDEF");
  EXPECT_TRUE(j["reason"].is_null());

  e.terminal_state = lendflow::domain::TerminalState::CustomerDropped;
  e.sanction_id.reset();
  e.reason = "customer declined";
  j = formatted(e);
  EXPECT_EQ(j["terminal_state"], "CUSTOMER_DROPPED");
  EXPECT_TRUE(j["sanction_id"].is_null());
  EXPECT_EQ(j["reason"], "customer declined");
}
