/**
 * @file ilogger.hpp
 * @author Artem Ulyanov
 * @date October 2026
 * @brief Базовый интерфейс логгеров webctl и вспомогательные компоненты.
 *
 * @details Все сообщения супервизора (переходы состояний, предупреждения о
 * таймаутах, фатальные ошибки) проходят через ILogger в виде одной строки
 * формата `<время> [УРОВЕНЬ] сообщение`.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <string>

namespace webctl {

enum class LogLevel {
  LOG_DEBUG,
  LOG_INFO,
  LOG_WARNING,
  LOG_ERROR,
  LOG_CRITICAL
};

/**
 * @class TimeFormatter
 * @brief Форматирование меток времени для всех логгеров
 *
 * @note Формат общий для процесса, по умолчанию `%Y-%m-%d %T`
 */
class TimeFormatter {
 public:
  /**
   * @brief Установить формат strftime для всех логгеров
   * @return false, если формат пустой (текущий формат не меняется)
   */
  static bool setGlobalFormat(const std::string& fmt);

  static std::string format(const std::chrono::system_clock::time_point& tp);

 private:
  inline static std::string globalFormat_ = "%Y-%m-%d %T";
};

class ILogger {
 public:
  virtual ~ILogger() = default;

  virtual void init(LogLevel level) = 0;

  virtual void setLogLevel(LogLevel level);
  virtual LogLevel getLogLevel() const;

  virtual void debug(const std::string& message);
  virtual void info(const std::string& message);
  virtual void warning(const std::string& message);
  virtual void error(const std::string& message);
  virtual void critical(const std::string& message);

  virtual void flush() = 0;

 protected:
  virtual void log(LogLevel level, const std::string& message) = 0;
  virtual bool shouldSkipLog(LogLevel level) const;

  std::atomic<LogLevel> currentLevel_ = LogLevel::LOG_INFO;
};

std::string leveltoString(LogLevel level);

/**
 * @brief Преобразовать строковое имя уровня в LogLevel
 * @param level Одно из: debug, info, warning, error, critical
 * @throw std::invalid_argument При неизвестном имени уровня
 */
LogLevel stringToLogLevel(const std::string& level);

}  // namespace webctl
