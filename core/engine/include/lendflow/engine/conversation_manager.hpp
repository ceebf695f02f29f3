#pragma once

#include "lendflow/config/config_loader.hpp"
#include "lendflow/engine/conversation_orchestrator.hpp"
#include "lendflow/eventbus/event_bus.hpp"
#include "lendflow/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

namespace lendflow {

class IpcServer;

// -----------------------------------------------------------------------------
// ConversationManager
// -----------------------------------------------------------------------------
//
// @brief  Programmatic root of the lendflow service: owns every live
//         conversation, the EventBus and the optional IPC surface.
//
// @details
// A conversation is created on its first message and lives until a turn
// reaches a terminal status or close() is called, whichever comes first.
// Either way the last display snapshot is archived and the session is
// released; a later message under the same id starts a new conversation.
// The archive holds at most config.max_archived_conversations snapshots and
// evicts the oldest first.
//
// Thread model:
//   processMessage(), snapshot(), close(), executeCommand() are safe from
//   any thread. Turns of one conversation are serialized by that session's
//   mutex; different conversations run concurrently. The session map is
//   guarded by a std::shared_mutex (shared for lookup, exclusive for
//   insert/close). start()/stop() are called from the owning thread only.
//
// Ownership:
//   ConversationManager
//    ├── config_          (EngineConfig — value member)
//    ├── bus_             (EventBus — value member, outlives sessions)
//    ├── sessions_        (shared_ptr<Session> per conversation id)
//    ├── archived_        (final snapshots of ended conversations)
//    ├── archive_order_   (archived_ ids, oldest first, for eviction)
//    ├── ipc_server_      (unique_ptr<IpcServer>, only while started)
//    ├── collaborators_   (non-owning references)
//    └── clock_           (const ITimeProvider& — non-owning)
//
// Sessions are shared_ptr so that close() can drop a session from the map
// while another thread still holds it. A retired session is flagged closed
// under its own mutex; a turn that finds the flag set looks the id up again
// instead of running on the orphan. Lock order is session mutex, then
// sessions_mutex_.
// -----------------------------------------------------------------------------
class ConversationManager {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  collaborators  Shared by every conversation. Must outlive this.
  // @param  config         Policies plus IPC endpoints. Empty endpoints
  //                        mean start() does not open sockets.
  // @param  clock          Event timestamps. Must outlive this.
  //
  // @details
  // No sockets are opened in the constructor. Conversations can be driven
  // through processMessage() without ever calling start().
  // -------------------------------------------------------------------------
  ConversationManager(Collaborators collaborators, EngineConfig config,
                      const ITimeProvider& clock);

  // Destructor calls stop().
  ~ConversationManager();

  ConversationManager(const ConversationManager&) = delete;
  ConversationManager& operator=(const ConversationManager&) = delete;
  ConversationManager(ConversationManager&&) = delete;
  ConversationManager& operator=(ConversationManager&&) = delete;

  // -------------------------------------------------------------------------
  // start() / stop()
  // -------------------------------------------------------------------------
  // start() brings up the IpcServer (when both endpoints are configured)
  // and bridges every bus event into its telemetry queue. stop() removes
  // the bridge and joins the server thread. Both are idempotent.
  // -------------------------------------------------------------------------
  void start();
  void stop();

  // -------------------------------------------------------------------------
  // processMessage(conversation_id, text)
  // -------------------------------------------------------------------------
  //
  // @brief  Runs one turn of the named conversation, creating it first if
  //         it does not exist yet.
  //
  // @throws std::invalid_argument if conversation_id is empty.
  // -------------------------------------------------------------------------
  TurnReply processMessage(const std::string& conversation_id,
                           const std::string& text);

  // Display snapshot of a live or archived conversation; nullopt if unknown.
  std::optional<nlohmann::json> snapshot(
      const std::string& conversation_id) const;

  // Archives and releases a live conversation. Returns false if it was not
  // live.
  bool close(const std::string& conversation_id);

  std::size_t activeConversations() const;

  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  //
  // @brief  Handles one host command and returns a JSON response string.
  //
  // @details
  // Requests are JSON objects with a "command" field:
  //
  //   PING     → {"status":"ok","response":"PONG"}
  //   PROCESS  {conversation_id, text}
  //            → {"status":"ok","reply":...,"state":{...}}
  //   STATE    {conversation_id} → {"status":"ok","state":{...}}
  //   STATUS   → {"status":"ok","active_conversations":N,
  //               "conversations":[{conversation_id, stage,
  //                                 terminal_state, total_agent_calls}]}
  //   CLOSE    {conversation_id} → {"status":"ok","response":...}
  //
  // The bare string "PING" is accepted too. Malformed JSON, a missing
  // field, an unknown command or an unknown conversation produce
  // {"status":"error","response":"..."}.
  //
  // Thread model: Called on the IPC thread or directly by tests.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& request);

  EventBus& eventBus() { return bus_; }

  const EngineConfig& config() const { return config_; }

 private:
  struct Session {
    std::mutex mutex;  // Serializes turns of this conversation
    std::unique_ptr<ConversationOrchestrator> orchestrator;
    bool closed{false};  // Guarded by mutex; set once, by retire()
  };

  std::shared_ptr<Session> findSession(const std::string& conversation_id) const;
  std::shared_ptr<Session> findOrCreateSession(
      const std::string& conversation_id);

  // Caller holds session->mutex. Flags the session closed, removes it from
  // sessions_ and archives its final snapshot.
  void retire(const std::string& conversation_id,
              const std::shared_ptr<Session>& session);

  nlohmann::json statusJson() const;

  Collaborators collaborators_;
  EngineConfig config_;
  const ITimeProvider& clock_;

  EventBus bus_;

  // Guards sessions_, archived_, archive_order_
  mutable std::shared_mutex sessions_mutex_;
  std::map<std::string, std::shared_ptr<Session>> sessions_;
  std::map<std::string, nlohmann::json> archived_;
  std::deque<std::string> archive_order_;

  std::unique_ptr<IpcServer> ipc_server_;
  std::optional<EventBus::SubscriptionId> telemetry_subscription_;
  bool running_{false};
};

}  // namespace lendflow
