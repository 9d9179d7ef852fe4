/**
 * @file SignalRouter.hpp
 * @brief Доставка SIGINT/SIGTERM супервизору в обычном потоке
 *
 * @author Artem Ulyanov
 * @company STC Ltd.
 * @date October 2026
 * @version 2.0
 * @license MIT
 *
 * @details Сигналы блокируются и читаются из signalfd рабочим потоком,
 * ожидающим на epoll. Обработчик вызывается в этом потоке, поэтому может
 * захватывать мьютексы и писать в лог.
 */
#pragma once

#include <signal.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace webctl {

/**
 * @class SignalRouter
 * @brief Маршрутизатор сигналов процесса (Singleton)
 *
 * @details На один сигнал можно повесить несколько обработчиков, они
 * вызываются в порядке регистрации. Маска, действовавшая до первой
 * регистрации, восстанавливается в unregisterHandler() и деструкторе.
 *
 * @warning registerHandler() вызывается из главного потока раньше запуска
 * других потоков: блокировка сигнала наследуется только потоками, созданными
 * после нее. SIGKILL и SIGSTOP перехватить нельзя.
 */
class SignalRouter {
 public:
  using Handler = std::function<void(int)>;  ///< Тип обработчика сигналов

  static SignalRouter& instance() {
    static SignalRouter router;
    return router;
  }

  SignalRouter(const SignalRouter&) = delete;
  SignalRouter& operator=(const SignalRouter&) = delete;

  /**
   * @brief Зарегистрировать обработчик для сигнала
   * @param signum Номер сигнала (например, SIGINT)
   * @param handler Функция-обработчик
   * @throw std::invalid_argument При неверном номере сигнала, SIGKILL, SIGSTOP
   * @throw std::system_error При ошибках системных вызовов
   *
   * @note Блокирует сигнал в вызывающем потоке и добавляет его в маску
   * signalfd
   *
   * @code
   * router.registerHandler(SIGTERM, [&](int sig) {
   *     controller.requestTermination(sig);
   * });
   * @endcode
   */
  void registerHandler(int signum, Handler handler);

  /**
   * @brief Удалить все обработчики для сигнала
   * @param signum Номер сигнала
   * @throw std::invalid_argument При неверном номере сигнала
   *
   * @note Сигнал разблокируется и снова обрабатывается по умолчанию
   */
  void unregisterHandler(int signum);

  /**
   * @brief Запустить рабочий поток; повторный вызов ничего не делает
   * @throw std::system_error Если не удалось создать epoll
   */
  void start();

  /// Остановить рабочий поток и дождаться его (до 100 мс)
  void stop() noexcept;

  bool isRunning() const noexcept { return running_.load(); }

  ~SignalRouter();

 private:
  SignalRouter();
  void processSignals(int epoll_fd);
  void dispatch(int signum);

  std::unordered_map<int, std::vector<Handler>> handlers_;
  std::mutex handlers_mutex_;
  std::atomic<bool> running_{false};
  std::thread worker_thread_;
  int signal_fd_ = -1;
  sigset_t original_mask_;   ///< Маска до первой регистрации
  sigset_t blocked_mask_{};  ///< Сигналы, отданные signalfd
};

}  // namespace webctl
