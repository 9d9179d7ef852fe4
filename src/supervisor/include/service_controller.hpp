/**
 * @file service_controller.hpp
 * @author Artem Ulyanov
 * @company STC Ltd.
 * @date October 2026
 * @brief Точка входа утилиты webctl
 *
 * @details
 * ServiceController выполняет один вызов `webctl <action>`:
 *  - разбор аргументов командной строки
 *  - загрузку конфигурации и настройку логгеров
 *  - захват межпроцессной блокировки действий
 *  - регистрацию SIGINT/SIGTERM в SignalRouter
 *  - выполнение действия через LifecycleController
 *  - преобразование результата в код завершения
 *
 * Коды завершения: 0 (успех или действие не требовалось), 1 (ошибка),
 * 128 + N (действие прервано сигналом N).
 */

#pragma once

#include <string>

#include "../include/argumentparser.hpp"
#include "../include/lifecycle_controller.hpp"
#include "../include/supervisor_settings.hpp"

/**
 * @class ServiceController
 * @brief Управление одним вызовом супервизора
 */
class ServiceController {
 public:
  /**
   * @brief Выполнить вызов
   * @return Код завершения процесса
   *
   * @code
   int main(int argc, char** argv) {
       ServiceController svc;
       return svc.run(argc, argv);
   }
   @endcode
   */
  int run(int argc, char **argv);

  /// Код завершения для отчета о действии
  static int exitCodeFor(const ActionReport &report);

 private:
  int execute(Action action, const SupervisorSettings &settings);

  /**
   * @brief Настроить CompositeLogger
   *
   * @details Логгеры берутся из `--log-type`, если он задан, иначе из
   * секции `logging` конфигурации. `--log-level` применяется последним.
   */
  void initLogger(const ParsedArgs &args, const SupervisorSettings &settings);

  void printVersion();
};
