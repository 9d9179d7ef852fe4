/**
 * @file argumentparser.cpp
 * @author Artem Ulyanov
 * @company STC Ltd.
 * @date October 2026
 * @brief Реализация парсера аргументов командной строки
 *
 * @details
 * Поддерживаются опции в формах `--name=value` и `--name value`.
 * Единственный позиционный аргумент задает действие.
 *
 * @version 2.0
 */

#include "../include/argumentparser.hpp"

#include <algorithm>

using namespace std;

const vector<string> ArgumentParser::validLogLevels = {
    "debug", "info", "warning", "error", "critical"};

const vector<string> ArgumentParser::validLogTypes = {"console", "file"};

ParsedArgs ArgumentParser::parse(int argc, char **argv) {
  ParsedArgs args;

  for (int i = 1; i < argc; ++i) {
    string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help_message = true;
    } else if (arg == "--version" || arg == "-v") {
      args.version_message = true;
    } else if (arg.compare(0, 10, "--override") == 0) {
      parseOverride(arg, args);
    } else if (arg.compare(0, 10, "--log-type") == 0) {
      parseLogType(optionValue(arg, "--log-type", i, argc, argv), args);
    } else if (arg.compare(0, 13, "--config-file") == 0) {
      args.config_path = optionValue(arg, "--config-file", i, argc, argv);
      args.config_path_explicit = true;
    } else if (arg.compare(0, 11, "--log-level") == 0) {
      parseLogLevel(optionValue(arg, "--log-level", i, argc, argv), args);
    } else if (arg.compare(0, 13, "--environment") == 0) {
      args.environment = optionValue(arg, "--environment", i, argc, argv);
    } else if (!arg.empty() && arg[0] == '-') {
      throw InvalidActionError("ArgumentParser: Unknown argument: " + arg);
    } else if (args.action.has_value()) {
      throw InvalidActionError("ArgumentParser: Unexpected argument: " + arg);
    } else {
      args.action = parseAction(arg);
    }
  }

  if (!args.action && !args.help_message && !args.version_message) {
    throw InvalidActionError("ArgumentParser: Action is required");
  }
  return args;
}

string ArgumentParser::optionValue(const string &arg, const string &name,
                                   int &i, int argc, char **argv) {
  if (arg.size() > name.size() && arg[name.size()] == '=') {
    return arg.substr(name.size() + 1);
  }
  if (arg != name) {
    throw InvalidActionError("ArgumentParser: Unknown argument: " + arg);
  }
  if (i + 1 < argc) {
    return argv[++i];
  }
  throw InvalidActionError("ArgumentParser: " + name + " requires a value");
}

void ArgumentParser::parseOverride(const string &arg, ParsedArgs &args) {
  size_t eqPos = arg.find('=');
  if (arg.compare(0, eqPos, "--override") != 0 || eqPos == string::npos) {
    throw InvalidActionError(
        "ArgumentParser: Invalid override format. Use --override=key:value");
  }

  string overrideStr = arg.substr(eqPos + 1);
  size_t colonPos = overrideStr.find(':');
  if (colonPos == string::npos || colonPos == 0) {
    throw InvalidActionError(
        "ArgumentParser: Invalid override format. Use key:value");
  }

  args.overrides[overrideStr.substr(0, colonPos)] =
      overrideStr.substr(colonPos + 1);
}

void ArgumentParser::parseLogType(const string &value, ParsedArgs &args) {
  string rest = value;
  size_t pos = 0;
  vector<string> types;
  while ((pos = rest.find(',')) != string::npos) {
    types.push_back(rest.substr(0, pos));
    rest.erase(0, pos + 1);
  }
  if (!rest.empty()) {
    types.push_back(rest);
  }

  for (const auto &type : types) {
    if (find(validLogTypes.begin(), validLogTypes.end(), type) ==
        validLogTypes.end()) {
      throw InvalidActionError("ArgumentParser: Invalid logger type: " + type);
    }
    args.logger_types.push_back(type);
  }
  args.use_cli_logging = true;
}

void ArgumentParser::parseLogLevel(const string &value, ParsedArgs &args) {
  if (find(validLogLevels.begin(), validLogLevels.end(), value) ==
      validLogLevels.end()) {
    throw InvalidActionError("ArgumentParser: Invalid log level: " + value);
  }
  args.log_level = value;
}

string ArgumentParser::usage(const string &program) {
  return "Usage: " + program +
         " [options] <start|stop|restart>\n\n"
         "Options:\n"
         " --help, -h            Show this help message\n"
         " --version, -v         Show version info\n"
         " --config-file=FILE    Configuration file path (default webctl.json)\n"
         " --environment=NAME    Configuration environment (default "
         "production)\n"
         " --override=KEY:VAL    Override config parameter (dotted key)\n"
         " --log-type=TYPES      Logger types (comma-separated: console,file)\n"
         " --log-level=LEVEL     Logging level "
         "[debug|info|warning|error|critical]\n";
}
