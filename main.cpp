// -----------------------------------------------------------------------------
// lendflow — single executable entry point.
//
//   lendflow [config.json]
//
//   1) Load the EngineConfig (defaults when no path is given).
//   2) Build the collaborators: CustomerDirectory (file or sample book),
//      RuleBasedFieldExtractor, SanctionDocumentGenerator.
//   3) Create the ConversationManager and subscribe logging callbacks.
//   4) Start it. With both IPC endpoints configured, conversations are
//      driven over ZeroMQ until Ctrl-C. With the endpoints left empty, a
//      single console conversation reads customer messages from stdin.
//   5) Shut down cleanly.
//
// Thread layout:
//   main thread   → waits for SIGINT, or runs the console conversation
//   ipc thread    → IpcServer (REP commands + PUB telemetry)
//
// No global state besides the SIGINT flag; everything else is stack-local.
// -----------------------------------------------------------------------------

#include "lendflow/collaborators/customer_directory.hpp"
#include "lendflow/collaborators/rule_based_field_extractor.hpp"
#include "lendflow/collaborators/sanction_document_generator.hpp"
#include "lendflow/config/config_loader.hpp"
#include "lendflow/engine/conversation_manager.hpp"
#include "lendflow/events/event.hpp"
#include "lendflow/time/live_time_provider.hpp"

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

// Set by the SIGINT handler, polled by the main thread.
static volatile std::sig_atomic_t g_shutdown_requested = 0;

static void sigint_handler(int /*signum*/) { g_shutdown_requested = 1; }

// Console mode: one conversation fed from stdin until EOF or END.
static void runConsole(lendflow::ConversationManager& manager) {
  const std::string conversation_id = "console";
  std::cout << "[main] Console conversation. Type a message (Ctrl-D to "
               "quit).\n";

  std::string line;
  while (!g_shutdown_requested && std::cout << "> " << std::flush &&
         std::getline(std::cin, line)) {
    lendflow::TurnReply turn = manager.processMessage(conversation_id, line);
    std::cout << turn.reply_text << "\n\n";
    if (!turn.state["terminal_state"].is_null()) {
      std::cout << "[main] Conversation finished: "
                << turn.state["terminal_state"].get<std::string>() << "\n";
      break;
    }
  }
}

int main(int argc, char* argv[]) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  lendflow::EngineConfig config;
  try {
    if (argc > 1) {
      config = lendflow::ConfigLoader::loadFile(argv[1]);
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Collaborators.
  // -------------------------------------------------------------------------
  lendflow::LiveTimeProvider clock;

  lendflow::CustomerDirectory directory;
  try {
    const auto records =
        config.customers_file.empty()
            ? lendflow::CustomerDirectory::sampleBook()
            : lendflow::CustomerDirectory::loadFile(config.customers_file);
    for (const auto& record : records) {
      directory.add(record);
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }
  std::cout << "[main] Customer directory holds " << directory.size()
            << " record(s).\n";

  lendflow::RuleBasedFieldExtractor extractor;
  lendflow::SanctionDocumentGenerator documents(clock,
                                                config.sanction_output_dir);

  // -------------------------------------------------------------------------
  // 3) ConversationManager + logging subscribers.
  // -------------------------------------------------------------------------
  const bool console_mode =
      config.command_endpoint.empty() || config.telemetry_endpoint.empty();

  lendflow::ConversationManager manager(
      lendflow::Collaborators{directory, extractor, documents}, config, clock);

  manager.eventBus().subscribe<lendflow::UnderwritingDecisionEvent>(
      [](const lendflow::UnderwritingDecisionEvent& e) {
        std::cout << "[Underwriting] conversation=" << e.conversation_id
                  << " decision=" << lendflow::domain::toString(e.decision)
                  << " amount=" << e.requested_amount;
        if (e.emi) {
          std::cout << " emi=" << *e.emi;
        }
        std::cout << "\n";
      });

  manager.eventBus().subscribe<lendflow::SafeguardTripEvent>(
      [](const lendflow::SafeguardTripEvent& e) {
        std::cerr << "[Safeguard] conversation=" << e.conversation_id
                  << " verdict=" << lendflow::toString(e.verdict)
                  << " calls=" << e.total_calls << "\n";
      });

  manager.eventBus().subscribe<lendflow::ConversationClosedEvent>(
      [](const lendflow::ConversationClosedEvent& e) {
        std::cout << "[Outcome] conversation=" << e.conversation_id
                  << " terminal_state="
                  << lendflow::domain::toString(e.terminal_state);
        if (e.sanction_id) {
          std::cout << " sanction_id=" << *e.sanction_id;
        }
        if (e.reason) {
          std::cout << " reason=\"" << *e.reason << "\"";
        }
        std::cout << "\n";
      });

  // -------------------------------------------------------------------------
  // 4) Start and run until shutdown.
  // -------------------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);

  try {
    manager.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] Failed to start: " << e.what() << "\n";
    return 1;
  }

  if (console_mode) {
    runConsole(manager);
  } else {
    std::cout << "[main] Serving commands on " << config.command_endpoint
              << ", telemetry on " << config.telemetry_endpoint << "\n"
              << "[main] Press Ctrl-C to shut down.\n";
    while (!g_shutdown_requested) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    std::cout << "\n[main] SIGINT received. Shutting down...\n";
  }

  // -------------------------------------------------------------------------
  // 5) Clean shutdown.
  // -------------------------------------------------------------------------
  manager.stop();
  return 0;
}
