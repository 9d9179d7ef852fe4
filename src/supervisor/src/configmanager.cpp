#include "../include/configmanager.hpp"

#include <stdexcept>

void ConfigManager::initialize(const std::string &filename) {
  configFilePath_ = filename;
  try {
    baseConfig_ = loader_.loadFromFile(filename);
    envProcessor_.process(baseConfig_);

    if (!validator_.validateRoot(baseConfig_)) {
      throw std::runtime_error("Invalid config structure");
    }
  } catch (const std::exception &e) {
    throw std::runtime_error(std::string("Config initialization failed: ") +
                             e.what());
  }
}

void ConfigManager::initializeDefaults() {
  configFilePath_.clear();
  baseConfig_ = defaultConfig();
  envProcessor_.process(baseConfig_);
}

nlohmann::json ConfigManager::getMergedConfig(const std::string &env) const {
  if (!baseConfig_.contains("environments") ||
      !baseConfig_["environments"].contains(env)) {
    throw std::runtime_error("Environment '" + env + "' not found");
  }

  // Файл может задавать только часть ключей, остальное берется из встроенных
  nlohmann::json merged = defaultConfig()["defaults"];
  merged.merge_patch(baseConfig_["defaults"]);
  merged.merge_patch(baseConfig_["environments"][env]);

  for (const auto &item : overrides_.items()) {
    merged[nlohmann::json::json_pointer(item.key())] = item.value();
  }

  validator_.validateMerged(merged);
  return merged;
}

void ConfigManager::applyCliOverrides(
    const std::unordered_map<std::string, std::string> &overrides) {
  for (const auto &[key, value] : overrides) {
    overrides_[toPointer(key).to_string()] = parseOverrideValue(value);
  }
}

nlohmann::json ConfigManager::defaultConfig() {
  return nlohmann::json::parse(R"({
    "defaults": {
      "pid_file": "tmp/server.pid",
      "port_file": "tmp/server.port",
      "port_range": { "start": 4000, "end": 4099 },
      "timeouts": {
        "poll_interval_ms": 50,
        "process_exit_ms": 5000,
        "port_release_ms": 3000,
        "restart_delay_ms": 500,
        "startup_grace_ms": 500,
        "lock_ms": 10000
      },
      "server": {
        "command": ["bun", "run", "src/index.ts"],
        "working_dir": ".",
        "port_env": "PORT"
      },
      "logging": [ { "type": "console", "level": "info" } ]
    },
    "environments": {
      "production": {},
      "development": {
        "logging": [ { "type": "console", "level": "debug" } ]
      }
    }
  })");
}

nlohmann::json::json_pointer ConfigManager::toPointer(
    const std::string &dottedKey) {
  if (dottedKey.empty() || dottedKey.front() == '.' ||
      dottedKey.back() == '.' || dottedKey.find("..") != std::string::npos) {
    throw std::runtime_error("ConfigManager: Invalid override key: " +
                             dottedKey);
  }

  std::string pointer;
  std::size_t start = 0;
  while (start <= dottedKey.size()) {
    std::size_t dot = dottedKey.find('.', start);
    if (dot == std::string::npos) dot = dottedKey.size();
    std::string token = dottedKey.substr(start, dot - start);

    // Экранирование по RFC 6901
    std::string escaped;
    for (char c : token) {
      if (c == '~')
        escaped += "~0";
      else if (c == '/')
        escaped += "~1";
      else
        escaped += c;
    }
    pointer += "/" + escaped;
    start = dot + 1;
  }
  return nlohmann::json::json_pointer(pointer);
}

nlohmann::json ConfigManager::parseOverrideValue(const std::string &value) {
  nlohmann::json parsed = nlohmann::json::parse(value, nullptr, false);
  if (parsed.is_discarded()) return value;
  return parsed;
}
