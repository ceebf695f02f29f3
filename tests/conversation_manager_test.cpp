// =============================================================================
// conversation_manager_test.cpp
// =============================================================================
// Tests for lendflow::ConversationManager without an IPC surface.
//
// Validates:
//   - Conversations are created on first message and kept apart by id
//   - executeCommand(): PING, PROCESS, STATE, STATUS, CLOSE, error replies
//   - close() archives the last snapshot; a new message starts afresh
//   - A terminal turn releases the session; the archive is bounded
//   - close() racing a waiting turn never strands that turn's effects
//   - Conversations driven from several threads at once
// =============================================================================

#include "lendflow/engine/conversation_manager.hpp"
#include "lendflow/time/simulation_time_provider.hpp"

#include "fakes/fake_collaborators.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using lendflow::ConversationManager;
using nlohmann::json;

class ConversationManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    lookup.add(lendflow::test::makeCustomer("CUST001", "Rahul Sharma",
                                            "9876543210", 780, true, 85000.0,
                                            500000.0, 12.5, 60, "PREMIUM"));
    extractor.script("3 lakh for 36 months", {300000.0, 36, std::nullopt});

    lendflow::EngineConfig config;
    config.command_endpoint.clear();
    config.telemetry_endpoint.clear();
    manager = std::make_unique<ConversationManager>(
        lendflow::Collaborators{lookup, extractor, documents}, config, clock);
  }

  json command(const json& request) {
    return json::parse(manager->executeCommand(request.dump()));
  }

  lendflow::SimulationTimeProvider clock{1718454600000};
  lendflow::test::FakeCustomerLookup lookup;
  lendflow::test::FakeFieldExtractor extractor;
  lendflow::test::FakeDocumentGenerator documents;
  std::unique_ptr<ConversationManager> manager;
};

// -----------------------------------------------------------------------------
// 1. Two ids are two independent conversations.
// -----------------------------------------------------------------------------
TEST_F(ConversationManagerTest, ConversationsAreKeptApartById) {
  manager->processMessage("a", "Hi");
  manager->processMessage("a", "9876543210");
  manager->processMessage("b", "Hi");

  EXPECT_EQ(manager->activeConversations(), 2u);
  EXPECT_EQ((*manager->snapshot("a"))["stage"], "OFFER_PRESENTATION");
  EXPECT_EQ((*manager->snapshot("b"))["stage"], "NEED_DISCOVERY");
  EXPECT_FALSE(manager->snapshot("c").has_value());
}

TEST_F(ConversationManagerTest, EmptyConversationIdThrows) {
  EXPECT_THROW(manager->processMessage("", "Hi"), std::invalid_argument);
}

TEST_F(ConversationManagerTest, PingPlainAndJson) {
  json plain = json::parse(manager->executeCommand("PING"));
  EXPECT_EQ(plain["status"], "ok");
  EXPECT_EQ(plain["response"], "PONG");

  json structured = command({{"command", "PING"}});
  EXPECT_EQ(structured["response"], "PONG");
}

// -----------------------------------------------------------------------------
// 2. A full journey over the command interface.
// Why: This is the surface an external chat front end talks to.
// -----------------------------------------------------------------------------
TEST_F(ConversationManagerTest, ProcessCommandDrivesConversation) {
  command({{"command", "PROCESS"}, {"conversation_id", "web-1"}, {"text", "Hi"}});
  command({{"command", "PROCESS"},
           {"conversation_id", "web-1"},
           {"text", "9876543210"}});
  json done = command({{"command", "PROCESS"},
                       {"conversation_id", "web-1"},
                       {"text", "3 lakh for 36 months"}});

  EXPECT_EQ(done["status"], "ok");
  EXPECT_TRUE(done["reply"].is_string());
  EXPECT_EQ(done["state"]["stage"], "END");
  EXPECT_EQ(done["state"]["terminal_state"], "LOAN_SANCTIONED");
  EXPECT_EQ(done["state"]["sanction_id"], "LF-TEST-1");

  json state = command({{"command", "STATE"}, {"conversation_id", "web-1"}});
  EXPECT_EQ(state["status"], "ok");
  EXPECT_EQ(state["state"]["customer_name"], "Rahul Sharma");
  EXPECT_EQ(state["state"]["archived"], true);
}

TEST_F(ConversationManagerTest, StatusListsLiveConversations) {
  manager->processMessage("a", "Hi");
  manager->processMessage("b", "Hi");
  manager->processMessage("b", "9876543210");

  json status = command({{"command", "STATUS"}});

  EXPECT_EQ(status["status"], "ok");
  EXPECT_EQ(status["active_conversations"], 2);
  ASSERT_EQ(status["conversations"].size(), 2u);
  EXPECT_EQ(status["conversations"][0]["conversation_id"], "a");
  EXPECT_EQ(status["conversations"][1]["stage"], "OFFER_PRESENTATION");
  EXPECT_TRUE(status["conversations"][1]["terminal_state"].is_null());
  EXPECT_EQ(status["conversations"][1]["total_agent_calls"], 0);
}

// -----------------------------------------------------------------------------
// 3. CLOSE archives the final snapshot; the id can then be reused.
// -----------------------------------------------------------------------------
TEST_F(ConversationManagerTest, CloseArchivesAndIdStartsAfresh) {
  manager->processMessage("a", "Hi");
  manager->processMessage("a", "9876543210");

  json closed = command({{"command", "CLOSE"}, {"conversation_id", "a"}});
  EXPECT_EQ(closed["status"], "ok");
  EXPECT_EQ(manager->activeConversations(), 0u);

  auto archived = manager->snapshot("a");
  ASSERT_TRUE(archived.has_value());
  EXPECT_EQ((*archived)["archived"], true);
  EXPECT_EQ((*archived)["stage"], "OFFER_PRESENTATION");

  json again = command({{"command", "CLOSE"}, {"conversation_id", "a"}});
  EXPECT_EQ(again["status"], "error");

  manager->processMessage("a", "Hi");
  auto fresh = manager->snapshot("a");
  ASSERT_TRUE(fresh.has_value());
  EXPECT_EQ((*fresh)["stage"], "NEED_DISCOVERY");
  EXPECT_FALSE(fresh->contains("archived"));
}

TEST_F(ConversationManagerTest, ErrorResponses) {
  json malformed = json::parse(manager->executeCommand("{ not json"));
  EXPECT_EQ(malformed["status"], "error");
  EXPECT_EQ(malformed["response"], "Malformed command: expected a JSON object");

  json array = json::parse(manager->executeCommand("[1, 2]"));
  EXPECT_EQ(array["status"], "error");

  json unknown = command({{"command", "REFINANCE"}});
  EXPECT_EQ(unknown["response"], "Unknown command: REFINANCE");

  json missing = command({{"command", "PROCESS"}, {"conversation_id", "x"}});
  EXPECT_EQ(missing["status"], "error");

  json empty_id = command(
      {{"command", "PROCESS"}, {"conversation_id", ""}, {"text", "Hi"}});
  EXPECT_EQ(empty_id["status"], "error");

  json no_such = command({{"command", "STATE"}, {"conversation_id", "zzz"}});
  EXPECT_EQ(no_such["response"], "Unknown conversation: zzz");
}

// -----------------------------------------------------------------------------
// 4. Conversations on separate threads all complete independently.
// Why: The manager is shared by the IPC thread and any direct callers;
//      per-session locking must not leak state between conversations.
// -----------------------------------------------------------------------------
TEST_F(ConversationManagerTest, ConcurrentConversations) {
  constexpr int kConversations = 8;

  std::atomic<int> sanctioned{0};
  std::vector<std::thread> workers;
  for (int i = 0; i < kConversations; ++i) {
    workers.emplace_back([this, i, &sanctioned] {
      const std::string id = "conv-" + std::to_string(i);
      manager->processMessage(id, "Hi");
      manager->processMessage(id, "9876543210");
      auto turn = manager->processMessage(id, "3 lakh for 36 months");
      if (turn.state["terminal_state"] == "LOAN_SANCTIONED") {
        sanctioned.fetch_add(1);
      }
    });
  }
  for (auto& w : workers) w.join();

  EXPECT_EQ(sanctioned.load(), kConversations);
  EXPECT_EQ(manager->activeConversations(), 0u);

  std::set<std::string> sanction_ids;
  for (int i = 0; i < kConversations; ++i) {
    auto state = manager->snapshot("conv-" + std::to_string(i));
    ASSERT_TRUE(state.has_value());
    sanction_ids.insert((*state)["sanction_id"].get<std::string>());
  }
  EXPECT_EQ(sanction_ids.size(), static_cast<std::size_t>(kConversations));
}

// -----------------------------------------------------------------------------
// 5. Reaching a terminal status releases the session at once.
// Why: Finished conversations must not pile up in memory until somebody
//      remembers to send CLOSE.
// -----------------------------------------------------------------------------
TEST_F(ConversationManagerTest, TerminalConversationIsReleasedAndArchived) {
  manager->processMessage("done", "Hi");
  manager->processMessage("done", "9876543210");
  EXPECT_EQ(manager->activeConversations(), 1u);

  auto turn = manager->processMessage("done", "3 lakh for 36 months");
  EXPECT_EQ(turn.state["terminal_state"], "LOAN_SANCTIONED");
  EXPECT_EQ(manager->activeConversations(), 0u);

  json state = command({{"command", "STATE"}, {"conversation_id", "done"}});
  EXPECT_EQ(state["status"], "ok");
  EXPECT_EQ(state["state"]["archived"], true);
  EXPECT_EQ(state["state"]["terminal_state"], "LOAN_SANCTIONED");
  EXPECT_EQ(state["state"]["sanction_id"], "LF-TEST-1");

  json status = command({{"command", "STATUS"}});
  EXPECT_EQ(status["active_conversations"], 0);

  json closed = command({{"command", "CLOSE"}, {"conversation_id", "done"}});
  EXPECT_EQ(closed["status"], "error");

  manager->processMessage("done", "Hi");
  auto fresh = manager->snapshot("done");
  ASSERT_TRUE(fresh.has_value());
  EXPECT_EQ((*fresh)["stage"], "NEED_DISCOVERY");
  EXPECT_FALSE(fresh->contains("archived"));
}

TEST_F(ConversationManagerTest, ArchiveEvictsOldestSnapshot) {
  lendflow::EngineConfig config;
  config.command_endpoint.clear();
  config.telemetry_endpoint.clear();
  config.max_archived_conversations = 2;
  manager = std::make_unique<ConversationManager>(
      lendflow::Collaborators{lookup, extractor, documents}, config, clock);

  for (const char* id : {"a", "b", "c"}) {
    manager->processMessage(id, "Hi");
    ASSERT_TRUE(manager->close(id));
  }

  EXPECT_FALSE(manager->snapshot("a").has_value());
  EXPECT_TRUE(manager->snapshot("b").has_value());
  EXPECT_TRUE(manager->snapshot("c").has_value());

  // Re-archiving "b" makes it the newest, so "c" goes next.
  manager->processMessage("b", "Hi");
  ASSERT_TRUE(manager->close("b"));
  manager->processMessage("d", "Hi");
  ASSERT_TRUE(manager->close("d"));

  EXPECT_TRUE(manager->snapshot("b").has_value());
  EXPECT_FALSE(manager->snapshot("c").has_value());
  EXPECT_TRUE(manager->snapshot("d").has_value());
}

// -----------------------------------------------------------------------------
// 6. close() and a turn on the same id, racing.
// Why: A turn that was waiting on the session while it was closed must not
//      run on the discarded session. Whichever order wins, the state the
//      turn returned is the state a later lookup sees.
// -----------------------------------------------------------------------------
TEST_F(ConversationManagerTest, CloseRacingTurnKeepsTurnVisible) {
  constexpr int kRounds = 200;

  for (int round = 0; round < kRounds; ++round) {
    const std::string id = "race-" + std::to_string(round);
    manager->processMessage(id, "Hi");

    lendflow::TurnReply turn;
    std::thread talker(
        [&] { turn = manager->processMessage(id, "Hello again"); });
    std::thread closer([&] { manager->close(id); });
    talker.join();
    closer.join();

    auto seen = manager->snapshot(id);
    ASSERT_TRUE(seen.has_value()) << id;
    EXPECT_EQ((*seen)["message_count"], turn.state["message_count"]) << id;
    EXPECT_EQ((*seen)["stage"], turn.state["stage"]) << id;
  }
}

TEST_F(ConversationManagerTest, StartWithoutEndpointsOpensNoSockets) {
  EXPECT_NO_THROW(manager->start());
  EXPECT_NO_THROW(manager->stop());
  EXPECT_NO_THROW(manager->stop());
}
