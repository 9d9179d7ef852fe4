/**
 * @file PortProber.hpp
 * @brief Проверка возможности занять TCP-порт
 *
 * @author Artem Ulyanov
 * @date October 2026
 * @version 1.0
 * @license MIT
 */
#pragma once

#include <chrono>

namespace webctl {

/**
 * @class IPortProber
 * @brief Интерфейс проверки доступности порта
 *
 * @details Выделен в интерфейс, чтобы в тестах аллокатора и контроллера
 * подставлять таблицу занятых портов вместо реальных сокетов.
 */
class IPortProber {
 public:
  virtual ~IPortProber() = default;

  /**
   * @brief Можно ли сейчас открыть слушающий сокет на порту
   * @param port Номер порта
   * @return true, если bind() и listen() на INADDR_ANY прошли успешно
   *
   * @note Не бросает исключений: любая ошибка означает "порт недоступен"
   */
  virtual bool isAvailable(int port) const = 0;

  /**
   * @brief Принимает ли кто-то соединения на порту
   * @param port Номер порта
   * @return true, если connect() на 127.0.0.1:port прошел успешно
   *
   * @details В отличие от isAvailable() порт не занимается, поэтому проверку
   * можно выполнять, пока сервер сам делает bind()
   */
  virtual bool isListening(int port) const = 0;
};

/**
 * @class TcpPortProber
 * @brief Проверка порта пробным bind()/listen() на всех интерфейсах
 *
 * @details Сокет создается с SO_REUSEADDR, как это делает большинство
 * HTTP-серверов, поэтому соединения в TIME_WAIT не считаются занятостью.
 * Сокет закрывается сразу после проверки.
 */
class TcpPortProber : public IPortProber {
 public:
  explicit TcpPortProber(
      std::chrono::milliseconds connectTimeout = std::chrono::milliseconds(100))
      : connectTimeout_(connectTimeout) {}

  bool isAvailable(int port) const override;
  bool isListening(int port) const override;

 private:
  std::chrono::milliseconds connectTimeout_;
};

}  // namespace webctl
