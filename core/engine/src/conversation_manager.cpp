#include "lendflow/engine/conversation_manager.hpp"

#include "lendflow/network/ipc_server.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace lendflow {

namespace {

nlohmann::json errorResponse(const std::string& message) {
  nlohmann::json response;
  response["status"] = "error";
  response["response"] = message;
  return response;
}

// Required string field of a command object.
std::string requireString(const nlohmann::json& request, const char* key) {
  auto it = request.find(key);
  if (it == request.end() || !it->is_string()) {
    throw std::invalid_argument(std::string("Missing or non-string field: ") +
                                key);
  }
  return it->get<std::string>();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ConversationManager::ConversationManager(Collaborators collaborators,
                                         EngineConfig config,
                                         const ITimeProvider& clock)
    : collaborators_(collaborators),
      config_(std::move(config)),
      clock_(clock) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
ConversationManager::~ConversationManager() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void ConversationManager::start() {
  if (running_) {
    return;
  }

  if (!config_.command_endpoint.empty() &&
      !config_.telemetry_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.command_endpoint, config_.telemetry_endpoint);
    ipc_server_->start();

    // Telemetry bridge: every conversation event goes to the PUB queue.
    telemetry_subscription_ = bus_.subscribe(
        [this](const Event& e) { ipc_server_->pushTelemetry(e); });
  }

  running_ = true;

  std::cout << "[ConversationManager] started"
            << (ipc_server_ ? " with IPC surface" : " without IPC surface")
            << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void ConversationManager::stop() {
  if (!running_) {
    return;
  }

  if (telemetry_subscription_) {
    bus_.unsubscribe(*telemetry_subscription_);
    telemetry_subscription_.reset();
  }
  ipc_server_.reset();

  running_ = false;

  std::cout << "[ConversationManager] stopped. "
            << activeConversations() << " conversation(s) still open.\n";
}

// -----------------------------------------------------------------------------
// processMessage()
// -----------------------------------------------------------------------------
TurnReply ConversationManager::processMessage(
    const std::string& conversation_id, const std::string& text) {
  if (conversation_id.empty()) {
    throw std::invalid_argument("conversation_id must not be empty");
  }

  for (;;) {
    std::shared_ptr<Session> session = findOrCreateSession(conversation_id);
    std::lock_guard lock(session->mutex);
    if (session->closed) {
      continue;  // Retired while we waited; the next lookup opens a fresh one
    }

    TurnReply turn = session->orchestrator->processMessage(text);
    if (session->orchestrator->state().isTerminal()) {
      retire(conversation_id, session);
    }
    return turn;
  }
}

// -----------------------------------------------------------------------------
// snapshot()
// -----------------------------------------------------------------------------
std::optional<nlohmann::json> ConversationManager::snapshot(
    const std::string& conversation_id) const {
  if (auto session = findSession(conversation_id)) {
    std::lock_guard lock(session->mutex);
    if (!session->closed) {
      return domain::toDisplayJson(session->orchestrator->state());
    }
  }

  std::shared_lock lock(sessions_mutex_);
  auto it = archived_.find(conversation_id);
  if (it == archived_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// close()
// -----------------------------------------------------------------------------
bool ConversationManager::close(const std::string& conversation_id) {
  std::shared_ptr<Session> session = findSession(conversation_id);
  if (!session) {
    return false;
  }

  std::lock_guard lock(session->mutex);
  if (session->closed) {
    return false;
  }
  retire(conversation_id, session);
  return true;
}

// -----------------------------------------------------------------------------
// retire(): closed flag, map removal, bounded archive
// -----------------------------------------------------------------------------
void ConversationManager::retire(const std::string& conversation_id,
                                 const std::shared_ptr<Session>& session) {
  session->closed = true;

  nlohmann::json final_state =
      domain::toDisplayJson(session->orchestrator->state());
  final_state["archived"] = true;

  std::size_t evicted = 0;
  {
    std::unique_lock lock(sessions_mutex_);
    auto it = sessions_.find(conversation_id);
    if (it != sessions_.end() && it->second == session) {
      sessions_.erase(it);
    }

    if (archived_.find(conversation_id) != archived_.end()) {
      archive_order_.erase(std::find(archive_order_.begin(),
                                     archive_order_.end(), conversation_id));
    }
    archive_order_.push_back(conversation_id);
    archived_[conversation_id] = std::move(final_state);

    while (archived_.size() > config_.max_archived_conversations &&
           !archive_order_.empty()) {
      archived_.erase(archive_order_.front());
      archive_order_.pop_front();
      ++evicted;
    }
  }

  std::cout << "[ConversationManager] conversation=" << conversation_id
            << " archived";
  if (evicted > 0) {
    std::cout << " (" << evicted << " old snapshot(s) evicted)";
  }
  std::cout << ".\n";
}

// -----------------------------------------------------------------------------
// activeConversations()
// -----------------------------------------------------------------------------
std::size_t ConversationManager::activeConversations() const {
  std::shared_lock lock(sessions_mutex_);
  return sessions_.size();
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string ConversationManager::executeCommand(const std::string& request) {
  if (request == "PING") {
    nlohmann::json response;
    response["status"] = "ok";
    response["response"] = "PONG";
    return response.dump();
  }

  nlohmann::json parsed = nlohmann::json::parse(request, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return errorResponse("Malformed command: expected a JSON object").dump();
  }

  nlohmann::json response;
  try {
    const std::string command = requireString(parsed, "command");

    if (command == "PING") {
      response["status"] = "ok";
      response["response"] = "PONG";
    } else if (command == "PROCESS") {
      const std::string id = requireString(parsed, "conversation_id");
      TurnReply turn = processMessage(id, requireString(parsed, "text"));
      response["status"] = "ok";
      response["reply"] = std::move(turn.reply_text);
      response["state"] = std::move(turn.state);
    } else if (command == "STATE") {
      const std::string id = requireString(parsed, "conversation_id");
      auto state = snapshot(id);
      if (!state) {
        return errorResponse("Unknown conversation: " + id).dump();
      }
      response["status"] = "ok";
      response["state"] = std::move(*state);
    } else if (command == "STATUS") {
      response = statusJson();
      response["status"] = "ok";
    } else if (command == "CLOSE") {
      const std::string id = requireString(parsed, "conversation_id");
      if (!close(id)) {
        return errorResponse("Unknown conversation: " + id).dump();
      }
      response["status"] = "ok";
      response["response"] = "Conversation " + id + " closed";
    } else {
      return errorResponse("Unknown command: " + command).dump();
    }
  } catch (const std::exception& e) {
    std::cerr << "[ConversationManager] command failed: " << e.what() << "\n";
    return errorResponse(e.what()).dump();
  }

  return response.dump();
}

// -----------------------------------------------------------------------------
// statusJson()
// -----------------------------------------------------------------------------
nlohmann::json ConversationManager::statusJson() const {
  std::map<std::string, std::shared_ptr<Session>> sessions;
  {
    std::shared_lock lock(sessions_mutex_);
    sessions = sessions_;
  }

  nlohmann::json list = nlohmann::json::array();
  for (const auto& [id, session] : sessions) {
    std::lock_guard lock(session->mutex);
    const domain::ConversationState& state = session->orchestrator->state();

    nlohmann::json entry;
    entry["conversation_id"] = id;
    entry["stage"] = domain::toString(state.stage);
    entry["terminal_state"] =
        state.terminal_state
            ? nlohmann::json(domain::toString(*state.terminal_state))
            : nlohmann::json(nullptr);
    entry["total_agent_calls"] = state.call_guard.totalCalls();
    list.push_back(std::move(entry));
  }

  nlohmann::json status;
  status["active_conversations"] = sessions.size();
  status["conversations"] = std::move(list);
  return status;
}

// -----------------------------------------------------------------------------
// findSession() / findOrCreateSession()
// -----------------------------------------------------------------------------
std::shared_ptr<ConversationManager::Session> ConversationManager::findSession(
    const std::string& conversation_id) const {
  std::shared_lock lock(sessions_mutex_);
  auto it = sessions_.find(conversation_id);
  return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<ConversationManager::Session>
ConversationManager::findOrCreateSession(const std::string& conversation_id) {
  if (auto existing = findSession(conversation_id)) {
    return existing;
  }

  std::unique_lock lock(sessions_mutex_);
  auto& slot = sessions_[conversation_id];
  if (!slot) {
    slot = std::make_shared<Session>();
    slot->orchestrator = std::make_unique<ConversationOrchestrator>(
        conversation_id, collaborators_, config_.conversation,
        config_.underwriting, clock_, &bus_);
    std::cout << "[ConversationManager] conversation=" << conversation_id
              << " opened.\n";
  }
  return slot;
}

}  // namespace lendflow
