/**
 * @file configmanager.hpp
 * @author Artem Ulyanov
 * @company STC Ltd.
 * @date October 2026
 * @brief Фасад для загрузки, обработки и слияния конфигурации супервизора
 *
 * @details
 * Класс ConfigManager объединяет подсистемы загрузки (ConfigLoader),
 * валидации (ConfigValidator) и подстановки переменных окружения
 * (EnvironmentProcessor). Итоговая конфигурация окружения строится как
 * `defaults`, к которому через merge_patch применена секция
 * `environments.<env>`, и затем переопределения из командной строки.
 *
 * Экземпляр создается ServiceController на время одного вызова
 * (не Singleton).
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

#include "../include/configloader.hpp"
#include "../include/configvalidator.hpp"
#include "../include/enviromentprocessor.hpp"

/**
 * @class ConfigManager
 * @brief Управление жизненным циклом конфигурации одного вызова
 *
 * @details
 * Позволяет:
 *  - Загрузить конфигурацию из JSON-файла или встроенные значения
 *  - Подставить `$ENV{VAR}` во все строковые значения
 *  - Объединить секции `defaults` и `environments` через merge_patch
 *  - Переопределить отдельные ключи (`a.b.c`) из командной строки
 *
 * @warning Не потокобезопасен
 */
class ConfigManager {
 public:
  /**
   * @brief Загрузить и проверить конфигурацию из файла
   * @param[in] filename Путь к JSON-файлу
   * @throw std::runtime_error При ошибке чтения, разбора или валидации
   */
  void initialize(const std::string &filename);

  /// Использовать встроенную конфигурацию (файл по умолчанию отсутствует)
  void initializeDefaults();

  /**
   * @brief Получить итоговую конфигурацию окружения
   * @param[in] env Имя окружения (например, "production")
   * @throw std::runtime_error Если окружение не описано или итоговая
   * конфигурация не проходит валидацию
   */
  nlohmann::json getMergedConfig(const std::string &env) const;

  /**
   * @brief Запомнить переопределения из командной строки
   *
   * @details Ключ задается через точку (`timeouts.lock_ms`). Значение
   * разбирается как JSON (`42`, `true`, `["a","b"]`), а при неудаче
   * используется как строка.
   */
  void applyCliOverrides(
      const std::unordered_map<std::string, std::string> &overrides);

  const std::string &getConfigFilePath() const { return configFilePath_; }

  /// Встроенная конфигурация в формате `defaults` / `environments`
  static nlohmann::json defaultConfig();

 private:
  static nlohmann::json::json_pointer toPointer(const std::string &dottedKey);
  static nlohmann::json parseOverrideValue(const std::string &value);

  ConfigLoader loader_;
  ConfigValidator validator_;
  EnvironmentProcessor envProcessor_;

  nlohmann::json baseConfig_;
  nlohmann::json overrides_ = nlohmann::json::object();
  std::string configFilePath_;
};
