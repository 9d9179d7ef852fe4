#pragma once

#include <initializer_list>
#include <memory>
#include <mutex>
#include <vector>

#include "webctl/ilogger.hpp"

namespace webctl {

/**
 * @class CompositeLogger
 * @brief Рассылка сообщений в набор логгеров
 *
 * @details Фильтрацию по уровню выполняют вложенные логгеры, поэтому
 * setLogLevel() применяется ко всем вложенным логгерам.
 */
class CompositeLogger : public ILogger {
 public:
  static CompositeLogger& instance();

  CompositeLogger() = default;
  CompositeLogger(std::initializer_list<std::shared_ptr<ILogger>> loggers)
      : loggers_(loggers) {}
  ~CompositeLogger() override = default;

  void addLogger(const std::shared_ptr<ILogger>& logger);
  void clearLoggers();
  std::size_t size() const;

  void init(LogLevel level) override;
  void setLogLevel(LogLevel level) override;
  void flush() override;

 protected:
  bool shouldSkipLog(LogLevel level) const override;
  void log(LogLevel level, const std::string& message) override;

 private:
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<ILogger>> loggers_;
};

}  // namespace webctl
