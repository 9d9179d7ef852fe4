/**
 * @file PidRegistry.hpp
 * @brief Хранение PID наблюдаемого процесса и проверка его жизни
 *
 * @author Artem Ulyanov
 * @date October 2026
 * @version 2.0
 * @license MIT
 *
 * @details Библиотека предоставляет:
 * - Запись/чтение/удаление PID-файла
 * - Проверку, жив ли процесс из PID-файла, без побочных эффектов
 */

#pragma once

#include <sys/types.h>

#include <filesystem>
#include <optional>

#include "webctl/ProcessHost.hpp"

namespace webctl {

/**
 * @class PidRegistry
 * @brief PID-файл сервера, запущенного супервизором
 *
 * @details В отличие от PID-файла демона, здесь хранится PID дочернего
 * процесса, а не текущего. Файл создается при запуске сервера и удаляется,
 * когда супервизор подтвердил (или перестал ожидать) его завершение.
 * Единственность экземпляра обеспечивается проверкой isAlive() перед
 * запуском, а не блокировкой самого файла.
 *
 * @warning Запись не атомарна: параллельное чтение может увидеть старое
 * содержимое. Контроллер всегда перепроверяет жизнь процесса.
 */
class PidRegistry {
 public:
  /**
   * @brief Конструктор
   * @param pidPath Путь к PID-файлу (может быть относительным)
   * @param host Источник сведений о процессах
   */
  PidRegistry(std::filesystem::path pidPath, IProcessHost& host);

  PidRegistry(const PidRegistry&) = delete;
  PidRegistry& operator=(const PidRegistry&) = delete;

  /**
   * @brief Записать PID, создав родительский каталог
   * @throw std::system_error При ошибках:
   * - Создания каталога
   * - Открытия файла или записи
   * - Установки прав (chmod)
   *
   * @note Устанавливает права 0644 на файл
   */
  void write(pid_t pid);

  /**
   * @brief Прочитать PID
   * @return std::nullopt, если файла нет или его содержимое не число
   */
  std::optional<pid_t> read() const;

  /**
   * @brief Жив ли процесс
   * @return false для std::nullopt и pid <= 0
   */
  bool isAlive(std::optional<pid_t> pid) const;

  /// Удалить PID-файл; повторный вызов ничего не делает
  void clear() noexcept;

  bool exists() const;

  const std::filesystem::path& path() const { return mPidPath; }

 private:
  std::filesystem::path mPidPath;  ///< Путь к PID-файлу
  IProcessHost& mHost;
};

}  // namespace webctl
