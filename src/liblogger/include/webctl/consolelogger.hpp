#pragma once

#include <mutex>

#include "webctl/ilogger.hpp"

#define WEBCTL_ANSI_COLOR_RESET "\033[0m"

namespace webctl {

/**
 * @class ConsoleLogger
 * @brief Вывод строк статуса оператору
 *
 * @details DEBUG и INFO пишутся в stdout, WARNING и выше в stderr.
 * Цвет включается только если соответствующий поток подключен к терминалу.
 */
class ConsoleLogger : public ILogger {
 public:
  static ConsoleLogger& instance();

  void init(LogLevel level) override;
  void flush() override;

  void setColorEnabled(bool enabled);

 protected:
  ConsoleLogger();
  ~ConsoleLogger() override = default;
  void log(LogLevel level, const std::string& message) override;

 private:
  static const char* colorCode(LogLevel level);

  mutable std::mutex mutex_;
  bool stdoutColor_ = false;
  bool stderrColor_ = false;
};

}  // namespace webctl
