/**
 * @file PortAllocator.hpp
 * @brief Поиск свободного порта в настроенном диапазоне
 *
 * @author Artem Ulyanov
 * @date October 2026
 * @version 1.0
 * @license MIT
 */
#pragma once

#include <stdexcept>

#include "webctl/PortProber.hpp"
#include "webctl/PortRange.hpp"

namespace webctl {

/**
 * @class ExhaustedRangeError
 * @brief В диапазоне не нашлось ни одного свободного порта
 */
class ExhaustedRangeError : public std::runtime_error {
 public:
  explicit ExhaustedRangeError(const PortRange& range)
      : std::runtime_error("PortAllocator: allocate(): No available port in "
                           "range " +
                           range.toString()),
        range_(range) {}

  const PortRange& range() const { return range_; }

 private:
  PortRange range_;
};

/**
 * @class PortAllocator
 * @brief Детерминированный перебор диапазона портов
 *
 * @details Перебор начинается с range.start, шаг 1, после range.end
 * продолжается с range.start. Выполняется ровно range.size() проверок,
 * после чего бросается ExhaustedRangeError, поэтому перебор всегда
 * завершается. Возвращается первый свободный порт в порядке перебора.
 *
 * @warning Между проверкой и bind() в дочернем процессе порт может занять
 * кто-то другой; аллокатор этого не предотвращает.
 */
class PortAllocator {
 public:
  PortAllocator(PortRange range, const IPortProber& prober);

  /**
   * @brief Найти свободный порт
   * @return Номер порта из диапазона
   * @throw ExhaustedRangeError Если свободных портов нет
   */
  int allocate() const;

  const PortRange& range() const { return range_; }

 private:
  PortRange range_;
  const IPortProber& prober_;
};

}  // namespace webctl
