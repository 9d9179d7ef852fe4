#include "webctl/filelogger.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>

namespace webctl {

FileLogger& FileLogger::instance() {
  static FileLogger instance;
  return instance;
}

void FileLogger::init(LogLevel level) {
  setLogLevel(level);
  std::lock_guard<std::mutex> lock(mutex_);
  reopenFiles();
}

void FileLogger::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (mainLogFile_.is_open()) mainLogFile_.flush();
  if (fallbackLogFile_.is_open()) fallbackLogFile_.flush();
}

void FileLogger::setMainLogPath(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (mainLogPath_ == path) return;
  mainLogPath_ = path;
  reopenFiles();
}

void FileLogger::setFallbackLogPath(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fallbackLogPath_ == path) return;
  fallbackLogPath_ = path;
  reopenFiles();
}

std::string FileLogger::getMainLogPath() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mainLogPath_;
}

std::string FileLogger::getFallbackLogPath() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fallbackLogPath_;
}

void FileLogger::log(LogLevel level, const std::string& message) {
  if (shouldSkipLog(level)) return;

  std::ostringstream formatted;
  formatted << TimeFormatter::format(std::chrono::system_clock::now()) << " ["
            << leveltoString(level) << "] " << message << "\n";

  std::lock_guard<std::mutex> lock(mutex_);
  if (!mainLogFile_.is_open() && !fallbackLogFile_.is_open()) {
    reopenFiles();
  }

  if (mainLogFile_.is_open()) {
    mainLogFile_ << formatted.str();
    mainLogFile_.flush();
    warnedAboutFallback_ = false;
  } else if (fallbackLogFile_.is_open()) {
    if (!warnedAboutFallback_) {
      std::cerr << "[LOGGER WARNING] Main log file unavailable, switching to "
                   "fallback log file: "
                << fallbackLogPath_ << std::endl;
      warnedAboutFallback_ = true;
    }
    fallbackLogFile_ << formatted.str();
    fallbackLogFile_.flush();
  } else {
    std::cerr << "[LOGGER ERROR] No log file is open: " << formatted.str();
  }
}

// Вызывается под mutex_
void FileLogger::reopenFiles() {
  namespace fs = std::filesystem;

  if (mainLogFile_.is_open()) mainLogFile_.close();
  if (fallbackLogFile_.is_open()) fallbackLogFile_.close();

  std::error_code ec;
  const fs::path parent = fs::path(mainLogPath_).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
  }

  mainLogFile_.open(mainLogPath_, std::ios::app);
  if (mainLogFile_.is_open()) return;

  std::cerr << "[LOGGER ERROR] Cannot open main log file: " << mainLogPath_
            << std::endl;
  fallbackLogFile_.open(fallbackLogPath_, std::ios::app);
  if (!fallbackLogFile_.is_open()) {
    std::cerr << "[LOGGER ERROR] Cannot open fallback log file: "
              << fallbackLogPath_ << std::endl;
  }
}

}  // namespace webctl
