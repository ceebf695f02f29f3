#include "lendflow/domain/conversation_state.hpp"

#include "lendflow/domain/customer.hpp"

#include <cstddef>
#include <utility>

namespace lendflow {
namespace domain {

namespace {

template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

// -----------------------------------------------------------------------------
// toString(Speaker)
// -----------------------------------------------------------------------------
const char* toString(Speaker speaker) {
  switch (speaker) {
    case Speaker::Customer:  return "customer";
    case Speaker::Assistant: return "assistant";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ConversationState::ConversationState(std::string id, int max_agent_calls)
    : conversation_id(std::move(id)), call_guard(max_agent_calls) {}

// -----------------------------------------------------------------------------
// addMessage()
// -----------------------------------------------------------------------------
void ConversationState::addMessage(Speaker speaker, std::string text) {
  messages.push_back(ChatMessage{speaker, std::move(text)});
}

// -----------------------------------------------------------------------------
// recentMessages()
// -----------------------------------------------------------------------------
std::vector<ChatMessage> ConversationState::recentMessages(
    std::size_t n) const {
  const std::size_t start = messages.size() > n ? messages.size() - n : 0;
  return std::vector<ChatMessage>(
      messages.begin() + static_cast<std::ptrdiff_t>(start), messages.end());
}

// -----------------------------------------------------------------------------
// toDisplayJson()
// -----------------------------------------------------------------------------
nlohmann::json toDisplayJson(const ConversationState& state) {
  nlohmann::json j;
  j["conversation_id"] = state.conversation_id;
  j["stage"] = toString(state.stage);

  j["customer_id"] = optionalToJson(state.customer_id);
  j["customer_name"] = optionalToJson(state.customer_name);
  j["phone"] = optionalToJson(state.phone);

  j["requested_amount"] = optionalToJson(state.requested_amount);
  j["tenure_months"] = optionalToJson(state.tenure_months);
  j["purpose"] = optionalToJson(state.purpose);

  j["preapproved_limit"] = optionalToJson(state.preapproved_limit);
  j["credit_score"] = optionalToJson(state.credit_score);
  j["credit_rating"] = state.credit_score
                           ? nlohmann::json(creditRating(*state.credit_score))
                           : nlohmann::json(nullptr);
  j["interest_rate"] = optionalToJson(state.interest_rate);

  j["salary"] = optionalToJson(state.salary);
  j["employer"] = optionalToJson(state.employer);
  j["salary_slip_received"] = state.salary_slip_received;
  j["kyc_verified"] = state.kyc_verified;

  j["emi"] = optionalToJson(state.emi);
  j["decision"] = state.decision ? nlohmann::json(toString(*state.decision))
                                 : nlohmann::json(nullptr);
  j["rejection_reason"] = optionalToJson(state.rejection_reason);
  j["suggested_amount"] = optionalToJson(state.suggested_amount);

  j["sanction_id"] = optionalToJson(state.sanction_id);
  j["document_available"] = state.document_available;
  j["terminal_state"] = state.terminal_state
                            ? nlohmann::json(toString(*state.terminal_state))
                            : nlohmann::json(nullptr);

  j["total_agent_calls"] = state.call_guard.totalCalls();
  j["max_agent_calls"] = state.call_guard.maxCalls();
  j["message_count"] = state.messages.size();
  return j;
}

}  // namespace domain
}  // namespace lendflow
