/**
 * @file configvalidator.cpp
 * @author Artem Ulyanov
 * @company STC Ltd.
 * @date October 2026
 * @brief Реализация валидатора структуры JSON-конфигурации
 *
 * @version 2.0
 */
#include "../include/configvalidator.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace std;

namespace {

void requireNonEmptyString(const nlohmann::json &node, const string &field) {
  if (!node.contains(field) || !node[field].is_string() ||
      node[field].get<string>().empty()) {
    throw runtime_error("ConfigValidator: '" + field +
                        "' must be a non-empty string");
  }
}

}  // namespace

bool ConfigValidator::validateRoot(const nlohmann::json &config) const {
  if (!config.is_object()) {
    throw runtime_error("ConfigValidator: Configuration root must be an object");
  }

  const vector<string> required_sections = {"defaults", "environments"};
  for (const auto &section : required_sections) {
    if (!config.contains(section) || !config[section].is_object()) {
      throw runtime_error("ConfigValidator: Missing required section: " +
                          section);
    }
  }

  if (config["defaults"].empty()) {
    throw runtime_error("ConfigValidator: Defaults section cannot be empty");
  }

  return true;
}

bool ConfigValidator::validateMerged(const nlohmann::json &merged) const {
  requireNonEmptyString(merged, "pid_file");
  requireNonEmptyString(merged, "port_file");

  if (!merged.contains("port_range")) {
    throw runtime_error("ConfigValidator: Missing required field: port_range");
  }
  validatePortRange(merged["port_range"]);

  if (merged.contains("timeouts")) validateTimeouts(merged["timeouts"]);

  if (!merged.contains("server")) {
    throw runtime_error("ConfigValidator: Missing required section: server");
  }
  validateServer(merged["server"]);

  if (merged.contains("logging")) validateLogging(merged["logging"]);

  return true;
}

void ConfigValidator::validatePortRange(const nlohmann::json &range) const {
  if (!range.is_object() || !range.contains("start") ||
      !range.contains("end") || !range["start"].is_number_integer() ||
      !range["end"].is_number_integer()) {
    throw runtime_error(
        "ConfigValidator: port_range must contain integer start and end");
  }

  const auto start = range["start"].get<long long>();
  const auto end = range["end"].get<long long>();
  if (start < 1 || end > 65535 || start > end) {
    throw runtime_error("ConfigValidator: Invalid port range [" +
                        to_string(start) + ", " + to_string(end) + "]");
  }
}

void ConfigValidator::validateTimeouts(const nlohmann::json &timeouts) const {
  if (!timeouts.is_object()) {
    throw runtime_error("ConfigValidator: timeouts must be an object");
  }

  for (const auto &item : timeouts.items()) {
    if (!item.value().is_number_integer() ||
        item.value().get<long long>() < 0) {
      throw runtime_error("ConfigValidator: timeouts." + item.key() +
                          " must be a non-negative integer");
    }
  }

  if (timeouts.contains("poll_interval_ms") &&
      timeouts["poll_interval_ms"].get<long long>() == 0) {
    throw runtime_error(
        "ConfigValidator: timeouts.poll_interval_ms must be positive");
  }
}

void ConfigValidator::validateServer(const nlohmann::json &server) const {
  if (!server.is_object()) {
    throw runtime_error("ConfigValidator: server must be an object");
  }

  if (!server.contains("command") || !server["command"].is_array() ||
      server["command"].empty()) {
    throw runtime_error(
        "ConfigValidator: server.command must be a non-empty array");
  }
  for (const auto &arg : server["command"]) {
    if (!arg.is_string()) {
      throw runtime_error(
          "ConfigValidator: server.command must contain only strings");
    }
  }
  if (server["command"][0].get<string>().empty()) {
    throw runtime_error("ConfigValidator: server.command[0] cannot be empty");
  }

  if (server.contains("port_env")) requireNonEmptyString(server, "port_env");
  if (server.contains("working_dir") && !server["working_dir"].is_string()) {
    throw runtime_error("ConfigValidator: server.working_dir must be a string");
  }
}

void ConfigValidator::validateLogging(const nlohmann::json &logging) const {
  if (!logging.is_array()) {
    throw runtime_error("ConfigValidator: logging must be an array");
  }

  const vector<string> valid_types = {"console", "file"};
  const vector<string> valid_levels = {"debug", "info", "warning", "error",
                                       "critical"};

  for (const auto &entry : logging) {
    if (!entry.is_object()) {
      throw runtime_error("ConfigValidator: Logger entry must be an object");
    }

    const string type = entry.value("type", "console");
    if (find(valid_types.begin(), valid_types.end(), type) ==
        valid_types.end()) {
      throw runtime_error("ConfigValidator: Invalid logger type: " + type);
    }

    const string level = entry.value("level", "info");
    if (find(valid_levels.begin(), valid_levels.end(), level) ==
        valid_levels.end()) {
      throw runtime_error("ConfigValidator: Invalid log level: " + level);
    }

    if (type == "file") requireNonEmptyString(entry, "file");
  }
}
