/**
 * @file action_lock.hpp
 * @author Artem Ulyanov
 * @company STC Ltd.
 * @date October 2026
 * @brief Межпроцессная блокировка действий супервизора
 *
 * @details Эксклюзивный flock() на файле `<pid_file>.lock`. Пока блокировка
 * удерживается, другой вызов webctl ждет, после чего заново читает
 * состояние, поэтому два одновременных `start` порождают один процесс.
 * Дескриптор открыт с O_CLOEXEC и не наследуется сервером.
 */
#pragma once

#include <chrono>
#include <filesystem>

class ActionLock {
 public:
  /**
   * @brief Захватить блокировку с ограниченным ожиданием
   * @param lockPath Путь к файлу блокировки (каталог создается)
   * @param timeout Максимальное время ожидания
   * @param interval Интервал повторных попыток
   * @throw std::runtime_error Если блокировка не получена за timeout
   * @throw std::system_error При ошибке open()/flock()
   */
  ActionLock(std::filesystem::path lockPath, std::chrono::milliseconds timeout,
             std::chrono::milliseconds interval);
  ~ActionLock();

  ActionLock(const ActionLock &) = delete;
  ActionLock &operator=(const ActionLock &) = delete;

  const std::filesystem::path &path() const { return path_; }

 private:
  std::filesystem::path path_;
  int fd_ = -1;
};
