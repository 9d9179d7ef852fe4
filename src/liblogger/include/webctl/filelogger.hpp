#pragma once

#include <fstream>
#include <mutex>
#include <string>

#include "webctl/ilogger.hpp"

namespace webctl {

/**
 * @class FileLogger
 * @brief Синхронная запись журнала в файл
 *
 * @details Сообщения дописываются в основной файл. Если его не удается
 * открыть, используется резервный файл; если недоступны оба, сообщение
 * уходит в stderr. Родительский каталог основного файла создается при
 * открытии.
 *
 * @warning Пути нужно задавать до init(): init() переоткрывает файлы
 */
class FileLogger : public ILogger {
 public:
  static FileLogger& instance();

  void init(LogLevel level) override;
  void flush() override;

  void setMainLogPath(const std::string& path);
  void setFallbackLogPath(const std::string& path);
  std::string getMainLogPath() const;
  std::string getFallbackLogPath() const;

 protected:
  FileLogger() = default;
  ~FileLogger() override = default;
  void log(LogLevel level, const std::string& message) override;

 private:
  void reopenFiles();

  mutable std::mutex mutex_;
  std::ofstream mainLogFile_;
  std::ofstream fallbackLogFile_;
  std::string mainLogPath_ = "webctl.log";
  std::string fallbackLogPath_ = "/tmp/webctl_fallback.log";
  bool warnedAboutFallback_ = false;
};

}  // namespace webctl
