#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../include/action.hpp"

struct ParsedArgs {
  std::optional<Action> action;
  std::string config_path = "webctl.json";
  bool config_path_explicit = false;
  std::unordered_map<std::string, std::string> overrides;
  std::vector<std::string> logger_types;
  std::optional<std::string> log_level;
  std::string environment = "production";
  bool use_cli_logging = false;
  bool help_message = false;
  bool version_message = false;
};

/**
 * @class ArgumentParser
 * @brief Разбор командной строки `webctl [options] <start|stop|restart>`
 *
 * @details Все ошибки сообщаются исключением InvalidActionError, чтобы
 * ServiceController мог вывести справку и завершиться с кодом 1.
 * Действие обязательно, если не запрошены --help или --version.
 */
class ArgumentParser {
 public:
  ParsedArgs parse(int argc, char **argv);

  static std::string usage(const std::string &program);

 private:
  static const std::vector<std::string> validLogLevels;
  static const std::vector<std::string> validLogTypes;

  void parseOverride(const std::string &arg, ParsedArgs &args);
  std::string optionValue(const std::string &arg, const std::string &name,
                          int &i, int argc, char **argv);
  void parseLogType(const std::string &value, ParsedArgs &args);
  void parseLogLevel(const std::string &value, ParsedArgs &args);
};
