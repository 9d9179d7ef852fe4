/**
 * @file lifecycle_controller.hpp
 * @author Artem Ulyanov
 * @company STC Ltd.
 * @date October 2026
 * @brief Конечный автомат запуска, остановки и перезапуска сервера
 *
 * @details
 * LifecycleController владеет порядком всех операций над PID-файлом и
 * файлом порта:
 *  - start: проверка живого экземпляра, выбор порта (повторное
 *    использование сохраненного или новое выделение), запуск процесса,
 *    наблюдение за стартом
 *  - stop: SIGTERM, ожидание завершения процесса и освобождения порта
 *  - restart: stop, пауза, start
 *
 * Все ожидания ограничены таймаутами из SupervisorSettings. Превышение
 * таймаута остановки не является ошибкой: выставляется флаг в отчете и
 * пишется предупреждение в лог.
 *
 * @note Состояние выводится из PID-файла при каждом вызове, между
 * вызовами webctl ничего не хранится в памяти.
 */
#pragma once

#include <sys/types.h>

#include <atomic>
#include <optional>
#include <string>

#include "../include/action.hpp"
#include "../include/supervisor_settings.hpp"
#include "webctl/PidRegistry.hpp"
#include "webctl/PortAllocator.hpp"
#include "webctl/PortProber.hpp"
#include "webctl/PortRegistry.hpp"
#include "webctl/ProcessHost.hpp"
#include "webctl/ilogger.hpp"

enum class LifecycleState { Stopped, Starting, Running, Stopping };

enum class ActionOutcome {
  Started,         ///< Новый процесс запущен
  AlreadyRunning,  ///< start при живом процессе, ничего не сделано
  Stopped,         ///< Процесс остановлен
  NotRunning,      ///< stop без живого процесса
  Interrupted      ///< Супервизор получил SIGINT/SIGTERM во время действия
};

/**
 * @struct ActionReport
 * @brief Результат одного действия
 */
struct ActionReport {
  Action action = Action::Start;
  ActionOutcome outcome = ActionOutcome::NotRunning;
  std::optional<pid_t> pid;
  std::optional<int> port;
  bool exitTimedOut = false;         ///< Процесс не завершился за таймаут
  bool portReleaseTimedOut = false;  ///< Порт не освободился за таймаут
  int interruptSignal = 0;           ///< Номер сигнала для Interrupted
};

std::string lifecycleStateToString(LifecycleState state);
std::string outcomeToString(ActionOutcome outcome);

class LifecycleController {
 public:
  LifecycleController(SupervisorSettings settings, webctl::PidRegistry &pids,
                      webctl::PortRegistry &ports,
                      const webctl::PortAllocator &allocator,
                      const webctl::IPortProber &prober,
                      webctl::IProcessHost &host, webctl::ILogger &logger);

  LifecycleController(const LifecycleController &) = delete;
  LifecycleController &operator=(const LifecycleController &) = delete;

  ActionReport run(Action action);

  /**
   * @brief Запустить сервер, если он еще не запущен
   * @throw webctl::ExhaustedRangeError Нет свободного порта в диапазоне
   * @throw webctl::SpawnError Процесс не создан или завершился во время
   * наблюдения за стартом
   */
  ActionReport start();

  /// Остановить сервер; таймауты отражаются флагами отчета
  ActionReport stop();

  ActionReport restart();

  /// Running, если PID-файл указывает на живой процесс, иначе Stopped
  LifecycleState inferState() const;

  LifecycleState state() const { return state_.load(); }

  /**
   * @brief Запросить прерывание текущего действия
   *
   * @details Безопасно вызывать из потока SignalRouter: только выставляет
   * флаг. SIGTERM дочернему процессу пересылает основной поток.
   */
  void requestTermination(int signum) noexcept;

  int terminationSignal() const noexcept { return terminationSignal_.load(); }

 private:
  int choosePort();
  webctl::SpawnRequest buildRequest(int port) const;
  ActionReport watchStartup(ActionReport report);
  /// SIGTERM процессу; ошибка kill() пишется в лог как предупреждение
  bool terminate(pid_t pid);
  bool waitForExit(pid_t pid);
  bool waitForPortRelease(int port);
  ActionReport interrupted(ActionReport report);
  void setState(LifecycleState state);

  SupervisorSettings settings_;
  webctl::PidRegistry &pids_;
  webctl::PortRegistry &ports_;
  const webctl::PortAllocator &allocator_;
  const webctl::IPortProber &prober_;
  webctl::IProcessHost &host_;
  webctl::ILogger &logger_;

  std::atomic<LifecycleState> state_{LifecycleState::Stopped};
  std::atomic<int> terminationSignal_{0};
};
