/**
 * @file supervisor_settings.hpp
 * @author Artem Ulyanov
 * @company STC Ltd.
 * @date October 2026
 * @brief Типизированные настройки супервизора
 *
 * @details Строятся из итоговой JSON-конфигурации окружения
 * (ConfigManager::getMergedConfig). Значения по умолчанию совпадают со
 * встроенной конфигурацией.
 */
#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "webctl/PortRange.hpp"

struct LoggerSettings {
  std::string type = "console";
  std::string level = "info";
  std::string file;
};

struct SupervisorSettings {
  std::string pidFile = "tmp/server.pid";
  std::string portFile = "tmp/server.port";
  webctl::PortRange portRange;

  std::chrono::milliseconds pollInterval{50};
  std::chrono::milliseconds processExitTimeout{5000};
  std::chrono::milliseconds portReleaseTimeout{3000};
  std::chrono::milliseconds restartDelay{500};
  std::chrono::milliseconds startupGrace{500};
  std::chrono::milliseconds lockTimeout{10000};

  std::vector<std::string> command{"bun", "run", "src/index.ts"};
  std::string workingDirectory = ".";
  std::string portEnv = "PORT";

  std::vector<LoggerSettings> loggers{LoggerSettings{}};

  /**
   * @brief Построить настройки из проверенной JSON-конфигурации
   * @throw nlohmann::json::exception При несовпадении типов значений
   * @throw std::invalid_argument При недопустимом диапазоне портов
   */
  static SupervisorSettings fromJson(const nlohmann::json &merged);
};
