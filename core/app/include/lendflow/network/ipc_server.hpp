#pragma once

#include "lendflow/concurrent/thread_safe_queue.hpp"
#include "lendflow/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace lendflow {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ host surface for commands and telemetry
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that answers JSON commands (REP socket)
//         and broadcasts conversation events as JSON (PUB socket).
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. REP socket (port 5556, configurable):
//      Each request is handed to command_handler_ (bound to
//      ConversationManager::executeCommand()) and its JSON response is sent
//      back. ZMQ_RCVTIMEO keeps the receive from blocking, so the thread
//      alternates between commands and telemetry.
//
//   2. PUB socket (port 5557, configurable):
//      Broadcasts StageTransitionEvent, UnderwritingDecisionEvent,
//      SafeguardTripEvent and ConversationClosedEvent. Events arrive via a
//      ThreadSafeQueue from whichever thread processed the turn.
//
// Thread model:
//   Constructed and destroyed by ConversationManager. start() spawns the
//   worker; stop() clears the atomic flag and joins it. pushTelemetry() may
//   be called from any thread. command_handler_ runs on the worker thread.
//
// Ownership:
//   Owned by ConversationManager via std::unique_ptr. Owns the ZMQ context,
//   both sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  command_handler  Takes a request string, returns a JSON reply.
  // @param  cmd_endpoint     ZMQ endpoint for the REP command socket.
  // @param  pub_endpoint     ZMQ endpoint for the PUB telemetry socket.
  //
  // @details
  // No sockets are opened and no threads are spawned here.
  // -------------------------------------------------------------------------
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Creates the context, binds both sockets and spawns the worker.
  // Idempotent. Throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // The worker notices within kPollTimeoutMs, publishes what is left in the
  // queue and exits. Sockets are closed after the join. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // Enqueues an event for the PUB socket. Safe from any thread.
  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  //
  // @brief  JSON text published for an event. Every message carries a
  //         "type" and the "conversation_id".
  //
  // @return std::nullopt for event types that are not broadcast.
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  // Worker loop: drain telemetry, then wait up to kPollTimeoutMs for a
  // command.
  void run();

  void processTelemetry();
  void processCommands();

  static std::string formatStageTransition(const StageTransitionEvent& e);
  static std::string formatUnderwritingDecision(
      const UnderwritingDecisionEvent& e);
  static std::string formatSafeguardTrip(const SafeguardTripEvent& e);
  static std::string formatConversationClosed(const ConversationClosedEvent& e);

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace lendflow
