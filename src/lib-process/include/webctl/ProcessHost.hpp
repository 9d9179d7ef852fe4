/**
 * @file ProcessHost.hpp
 * @brief Порождение процессов, проверка их жизни и доставка сигналов
 *
 * @author Artem Ulyanov
 * @date October 2026
 * @version 1.0
 * @license MIT
 *
 * @details Операционная система скрыта за интерфейсом IProcessHost, чтобы
 * контроллер жизненного цикла можно было тестировать на поддельной таблице
 * процессов без реальных fork()/kill().
 */

#pragma once

#include <sys/types.h>

#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace webctl {

/// Сигналы, которые супервизор доставляет дочернему процессу
enum class ProcessSignal { Terminate, Interrupt, Kill };

/**
 * @struct SpawnRequest
 * @brief Параметры запуска дочернего процесса
 */
struct SpawnRequest {
  std::vector<std::string> argv;  ///< argv[0] ищется в PATH
  std::string workingDirectory;   ///< Пустая строка: текущий каталог
  std::vector<std::pair<std::string, std::string>>
      environment;  ///< Добавляются к окружению супервизора
};

/**
 * @class SpawnError
 * @brief Не удалось создать дочерний процесс
 *
 * @details code() содержит errno от fork()/execvpe()/chdir()
 */
class SpawnError : public std::system_error {
 public:
  SpawnError(int err, const std::string& what)
      : std::system_error(err, std::system_category(), what) {}
};

class IProcessHost {
 public:
  virtual ~IProcessHost() = default;

  /**
   * @brief Запустить процесс в новой сессии
   * @return PID запущенного процесса
   * @throw SpawnError Если процесс не создан или exec не удался
   */
  virtual pid_t spawn(const SpawnRequest& request) = 0;

  /**
   * @brief Существует ли процесс, которому можно послать сигнал (проба
   * сигналом 0)
   * @note Процесс другого пользователя (EPERM) считается мертвым
   * @note Завершившийся дочерний процесс текущего процесса пожинается и
   * считается мертвым
   */
  virtual bool isAlive(pid_t pid) = 0;

  /**
   * @brief Доставить сигнал
   * @return false, если процесса уже нет
   * @throw std::system_error При прочих ошибках kill() (например, EPERM)
   */
  virtual bool signal(pid_t pid, ProcessSignal kind) = 0;
};

/**
 * @class PosixProcessHost
 * @brief Реализация IProcessHost на fork()/execvpe()/kill()/waitpid()
 *
 * @details Ребенок запускается в новой сессии (setsid), с пустой маской
 * сигналов и обработчиками по умолчанию, stdio наследуется. Ошибка exec
 * передается родителю через канал с O_CLOEXEC: если канал закрылся без
 * данных, exec прошел успешно.
 */
class PosixProcessHost : public IProcessHost {
 public:
  pid_t spawn(const SpawnRequest& request) override;
  bool isAlive(pid_t pid) override;
  bool signal(pid_t pid, ProcessSignal kind) override;

  static int toSignalNumber(ProcessSignal kind);
};

}  // namespace webctl
