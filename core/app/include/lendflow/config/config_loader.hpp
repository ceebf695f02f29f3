#pragma once

#include "lendflow/domain/conversation_policy.hpp"
#include "lendflow/domain/underwriting_policy.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace lendflow {

// -----------------------------------------------------------------------------
// EngineConfig — everything the lendflow executable is configured with
// -----------------------------------------------------------------------------
//
// @details
// Empty endpoints disable the IpcServer. An empty customers_file means the
// built-in sample book. An empty sanction_output_dir keeps sanction letters
// in memory only.
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::UnderwritingPolicy underwriting;
  domain::ConversationPolicy conversation;

  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string telemetry_endpoint{"tcp://127.0.0.1:5557"};

  std::string customers_file;
  std::string sanction_output_dir;

  // Final snapshots kept after conversations end; oldest evicted first.
  std::size_t max_archived_conversations{1000};
};

// -----------------------------------------------------------------------------
// ConfigLoader — JSON configuration reader
// -----------------------------------------------------------------------------
//
// @brief  Builds an EngineConfig from a JSON document. Every key is
//         optional; a missing key keeps the EngineConfig default.
//
// @details
// Layout:
//
//   {
//     "underwriting": {
//       "min_credit_score": 700, "max_emi_to_salary_ratio": 0.5,
//       "stretch_multiplier": 2.0, "default_tenure_months": 12
//     },
//     "conversation": {
//       "max_agent_calls": 6, "max_message_chars": 2000,
//       "extraction_context_messages": 4,
//       "auto_continue": { "KYC_VERIFICATION": true, "SANCTION": false }
//     },
//     "network": {
//       "command_endpoint": "tcp://127.0.0.1:5556",
//       "telemetry_endpoint": "tcp://127.0.0.1:5557"
//     },
//     "data": {
//       "customers_file": "config/customers.json",
//       "sanction_output_dir": "",
//       "max_archived_conversations": 1000
//     }
//   }
//
// auto_continue entries override the defaults stage by stage; stages not
// listed keep their default.
//
// Error handling:
//   Throws std::runtime_error for an unreadable file, invalid JSON, a value
//   of the wrong type, an unknown stage name, or a value outside its valid
//   range (non-positive budget, ratio outside (0, 1], multiplier < 1).
// -----------------------------------------------------------------------------
class ConfigLoader {
 public:
  static EngineConfig loadFile(const std::string& path);
  static EngineConfig fromJson(const nlohmann::json& doc);
};

}  // namespace lendflow
