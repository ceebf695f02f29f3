#include "lendflow/config/config_loader.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace lendflow {

namespace {

// Reads obj[key] into out when present; leaves out untouched otherwise.
template <typename T>
void readOptional(const nlohmann::json& obj, const char* key, T& out) {
  auto it = obj.find(key);
  if (it != obj.end() && !it->is_null()) {
    out = it->get<T>();
  }
}

const nlohmann::json* section(const nlohmann::json& doc, const char* name) {
  auto it = doc.find(name);
  if (it == doc.end() || it->is_null()) {
    return nullptr;
  }
  if (!it->is_object()) {
    throw std::runtime_error(std::string("Config section '") + name +
                             "' must be an object");
  }
  return &*it;
}

void validate(const EngineConfig& config) {
  const auto& uw = config.underwriting;
  if (uw.max_emi_to_salary_ratio <= 0.0 || uw.max_emi_to_salary_ratio > 1.0) {
    throw std::runtime_error(
        "underwriting.max_emi_to_salary_ratio must be in (0, 1]");
  }
  if (uw.stretch_multiplier < 1.0) {
    throw std::runtime_error("underwriting.stretch_multiplier must be >= 1");
  }
  if (uw.default_tenure_months <= 0) {
    throw std::runtime_error(
        "underwriting.default_tenure_months must be positive");
  }
  if (config.conversation.max_agent_calls <= 0) {
    throw std::runtime_error("conversation.max_agent_calls must be positive");
  }
  if (config.max_archived_conversations == 0) {
    throw std::runtime_error("data.max_archived_conversations must be positive");
  }
  if (config.conversation.max_message_chars == 0) {
    throw std::runtime_error("conversation.max_message_chars must be positive");
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// loadFile()
// -----------------------------------------------------------------------------
EngineConfig ConfigLoader::loadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  nlohmann::json doc;
  try {
    in >> doc;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("Invalid JSON in config file " + path + ": " +
                             e.what());
  }

  EngineConfig config = fromJson(doc);
  std::cout << "[ConfigLoader] loaded " << path << "\n";
  return config;
}

// -----------------------------------------------------------------------------
// fromJson()
// -----------------------------------------------------------------------------
EngineConfig ConfigLoader::fromJson(const nlohmann::json& doc) {
  if (!doc.is_object()) {
    throw std::runtime_error("Config root must be a JSON object");
  }

  EngineConfig config;
  try {
    if (const auto* uw = section(doc, "underwriting")) {
      readOptional(*uw, "min_credit_score", config.underwriting.min_credit_score);
      readOptional(*uw, "max_emi_to_salary_ratio",
                   config.underwriting.max_emi_to_salary_ratio);
      readOptional(*uw, "stretch_multiplier",
                   config.underwriting.stretch_multiplier);
      readOptional(*uw, "default_tenure_months",
                   config.underwriting.default_tenure_months);
    }

    if (const auto* conv = section(doc, "conversation")) {
      readOptional(*conv, "max_agent_calls",
                   config.conversation.max_agent_calls);
      readOptional(*conv, "max_message_chars",
                   config.conversation.max_message_chars);
      readOptional(*conv, "extraction_context_messages",
                   config.conversation.extraction_context_messages);

      auto flags = conv->find("auto_continue");
      if (flags != conv->end() && !flags->is_null()) {
        if (!flags->is_object()) {
          throw std::runtime_error(
              "conversation.auto_continue must be an object");
        }
        for (const auto& item : flags->items()) {
          auto stage = domain::stageFromString(item.key());
          if (!stage) {
            throw std::runtime_error("Unknown stage in auto_continue: " +
                                     item.key());
          }
          config.conversation.auto_continue[*stage] = item.value().get<bool>();
        }
      }
    }

    if (const auto* net = section(doc, "network")) {
      readOptional(*net, "command_endpoint", config.command_endpoint);
      readOptional(*net, "telemetry_endpoint", config.telemetry_endpoint);
    }

    if (const auto* data = section(doc, "data")) {
      readOptional(*data, "customers_file", config.customers_file);
      readOptional(*data, "sanction_output_dir", config.sanction_output_dir);
      readOptional(*data, "max_archived_conversations",
                   config.max_archived_conversations);
    }
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("Invalid config value: ") + e.what());
  }

  validate(config);
  return config;
}

}  // namespace lendflow
