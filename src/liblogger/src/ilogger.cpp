#include "webctl/ilogger.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

bool webctl::TimeFormatter::setGlobalFormat(const std::string& fmt) {
  if (fmt.empty()) return false;
  globalFormat_ = fmt;
  return true;
}

std::string webctl::TimeFormatter::format(
    const std::chrono::system_clock::time_point& tp) {
  auto time = std::chrono::system_clock::to_time_t(tp);
  std::tm local_tm{};
  if (localtime_r(&time, &local_tm) == nullptr) {
    return "[INVALID_TIME]";
  }

  std::ostringstream oss;
  oss << std::put_time(&local_tm, globalFormat_.c_str());
  return oss.str();
}

void webctl::ILogger::setLogLevel(LogLevel level) {
  currentLevel_.store(level, std::memory_order_release);
}

webctl::LogLevel webctl::ILogger::getLogLevel() const {
  return currentLevel_.load(std::memory_order_acquire);
}

void webctl::ILogger::debug(const std::string& message) {
  log(LogLevel::LOG_DEBUG, message);
}

void webctl::ILogger::info(const std::string& message) {
  log(LogLevel::LOG_INFO, message);
}

void webctl::ILogger::warning(const std::string& message) {
  log(LogLevel::LOG_WARNING, message);
}

void webctl::ILogger::error(const std::string& message) {
  log(LogLevel::LOG_ERROR, message);
}

void webctl::ILogger::critical(const std::string& message) {
  log(LogLevel::LOG_CRITICAL, message);
}

bool webctl::ILogger::shouldSkipLog(LogLevel level) const {
  return static_cast<int>(level) <
         static_cast<int>(currentLevel_.load(std::memory_order_acquire));
}

std::string webctl::leveltoString(LogLevel level) {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return "DEBUG";
    case LogLevel::LOG_INFO:
      return "INFO";
    case LogLevel::LOG_WARNING:
      return "WARNING";
    case LogLevel::LOG_ERROR:
      return "ERROR";
    case LogLevel::LOG_CRITICAL:
      return "CRITICAL";
  }
  return "UNKNOWN";
}

webctl::LogLevel webctl::stringToLogLevel(const std::string& level) {
  if (level == "debug") return LogLevel::LOG_DEBUG;
  if (level == "info") return LogLevel::LOG_INFO;
  if (level == "warning") return LogLevel::LOG_WARNING;
  if (level == "error") return LogLevel::LOG_ERROR;
  if (level == "critical") return LogLevel::LOG_CRITICAL;
  throw std::invalid_argument("stringToLogLevel: Unknown log level: " + level);
}
