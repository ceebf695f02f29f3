#include "lendflow/network/ipc_server.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace lendflow {

// -----------------------------------------------------------------------------
// Constructor: store parameters for deferred socket creation
// -----------------------------------------------------------------------------
IpcServer::IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);

  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

// -----------------------------------------------------------------------------
// pushTelemetry(): thread-safe enqueue from a turn's thread
// -----------------------------------------------------------------------------
void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): combined poll/drain loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }

  // Final drain before shutdown.
  processTelemetry();
}

// -----------------------------------------------------------------------------
// processTelemetry(): drain queue and publish JSON on PUB socket
// -----------------------------------------------------------------------------
void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    auto json_str = formatTelemetry(*maybe_event);
    if (json_str.has_value()) {
      zmq::message_t msg(json_str->data(), json_str->size());
      pub_socket_->send(msg, zmq::send_flags::dontwait);
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): dispatch Event variant to per-type formatters
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  if (auto* e = std::get_if<StageTransitionEvent>(&event)) {
    return formatStageTransition(*e);
  }
  if (auto* e = std::get_if<UnderwritingDecisionEvent>(&event)) {
    return formatUnderwritingDecision(*e);
  }
  if (auto* e = std::get_if<SafeguardTripEvent>(&event)) {
    return formatSafeguardTrip(*e);
  }
  if (auto* e = std::get_if<ConversationClosedEvent>(&event)) {
    return formatConversationClosed(*e);
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// formatStageTransition()
// -----------------------------------------------------------------------------
std::string IpcServer::formatStageTransition(const StageTransitionEvent& e) {
  nlohmann::json j;
  j["type"] = "stage_transition";
  j["conversation_id"] = e.conversation_id;
  j["from"] = domain::toString(e.from);
  j["to"] = domain::toString(e.to);
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  j["sequence_id"] = e.sequence_id;
  return j.dump();
}

// -----------------------------------------------------------------------------
// formatUnderwritingDecision()
// -----------------------------------------------------------------------------
std::string IpcServer::formatUnderwritingDecision(
    const UnderwritingDecisionEvent& e) {
  nlohmann::json j;
  j["type"] = "underwriting_decision";
  j["conversation_id"] = e.conversation_id;
  j["decision"] = domain::toString(e.decision);
  j["requested_amount"] = e.requested_amount;
  j["emi"] = e.emi ? nlohmann::json(*e.emi) : nlohmann::json(nullptr);
  j["reason"] = e.reason;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  j["sequence_id"] = e.sequence_id;
  return j.dump();
}

// -----------------------------------------------------------------------------
// formatSafeguardTrip()
// -----------------------------------------------------------------------------
std::string IpcServer::formatSafeguardTrip(const SafeguardTripEvent& e) {
  nlohmann::json j;
  j["type"] = "safeguard_trip";
  j["conversation_id"] = e.conversation_id;
  j["agent"] = e.agent_name;
  j["verdict"] = toString(e.verdict);
  j["total_calls"] = e.total_calls;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  j["sequence_id"] = e.sequence_id;
  return j.dump();
}

// -----------------------------------------------------------------------------
// formatConversationClosed()
// -----------------------------------------------------------------------------
std::string IpcServer::formatConversationClosed(
    const ConversationClosedEvent& e) {
  nlohmann::json j;
  j["type"] = "conversation_closed";
  j["conversation_id"] = e.conversation_id;
  j["terminal_state"] = domain::toString(e.terminal_state);
  j["sanction_id"] =
      e.sanction_id ? nlohmann::json(*e.sanction_id) : nlohmann::json(nullptr);
  j["reason"] = e.reason ? nlohmann::json(*e.reason) : nlohmann::json(nullptr);
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  j["sequence_id"] = e.sequence_id;
  return j.dump();
}

}  // namespace lendflow
