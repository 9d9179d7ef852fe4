#include "webctl/consolelogger.hpp"

#include <unistd.h>

#include <iostream>
#include <sstream>

webctl::ConsoleLogger& webctl::ConsoleLogger::instance() {
  static ConsoleLogger instance;
  return instance;
}

webctl::ConsoleLogger::ConsoleLogger()
    : stdoutColor_(isatty(STDOUT_FILENO) == 1),
      stderrColor_(isatty(STDERR_FILENO) == 1) {}

void webctl::ConsoleLogger::init(LogLevel level) { setLogLevel(level); }

void webctl::ConsoleLogger::setColorEnabled(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  stdoutColor_ = enabled;
  stderrColor_ = enabled;
}

void webctl::ConsoleLogger::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout.flush();
  std::cerr.flush();
}

void webctl::ConsoleLogger::log(LogLevel level, const std::string& message) {
  if (shouldSkipLog(level)) return;

  std::ostringstream formatted;
  formatted << TimeFormatter::format(std::chrono::system_clock::now()) << " ["
            << leveltoString(level) << "] " << message;

  const bool toStderr = level >= LogLevel::LOG_WARNING;
  std::ostream& out = toStderr ? std::cerr : std::cout;

  std::lock_guard<std::mutex> lock(mutex_);
  if (toStderr ? stderrColor_ : stdoutColor_) {
    out << colorCode(level) << formatted.str() << WEBCTL_ANSI_COLOR_RESET
        << std::endl;
  } else {
    out << formatted.str() << std::endl;
  }
}

const char* webctl::ConsoleLogger::colorCode(LogLevel level) {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return "\033[36m";  // Cyan
    case LogLevel::LOG_INFO:
      return "\033[32m";  // Green
    case LogLevel::LOG_WARNING:
      return "\033[33m";  // Yellow
    case LogLevel::LOG_ERROR:
      return "\033[31m";  // Red
    case LogLevel::LOG_CRITICAL:
      return "\033[41m\033[37m";  // White on Red
  }
  return WEBCTL_ANSI_COLOR_RESET;
}
