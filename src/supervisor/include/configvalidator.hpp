/**
 * @file configvalidator.hpp
 * @author Artem Ulyanov
 * @company STC Ltd.
 * @date October 2026
 * @brief Валидация структуры JSON-конфигурации
 *
 * @details
 * Проверяет:
 * - корневые секции `"defaults"` и `"environments"`
 * - итоговую (слитую) конфигурацию окружения: пути к файлам состояния,
 *   диапазон портов, таймауты, команду сервера и секцию `"logging"`
 *
 * Все методы бросают std::runtime_error с описанием первого найденного
 * нарушения.
 */

#pragma once

#include <nlohmann/json.hpp>

class ConfigValidator {
 public:
  bool validateRoot(const nlohmann::json &config) const;

  /**
   * @brief Проверить конфигурацию конкретного окружения
   * @param[in] merged Результат слияния `defaults` и `environments.<env>`
   * @throw std::runtime_error При нарушении структуры или значений
   */
  bool validateMerged(const nlohmann::json &merged) const;

 private:
  void validatePortRange(const nlohmann::json &range) const;
  void validateTimeouts(const nlohmann::json &timeouts) const;
  void validateServer(const nlohmann::json &server) const;
  void validateLogging(const nlohmann::json &logging) const;
};
