/**
 * @file enviromentprocessor.hpp
 * @brief Подстановка значений переменных окружения в JSON-конфигурацию
 *
 * @author Artem Ulyanov
 * @company STC Ltd.
 * @date October 2026
 *
 * @details
 * Во всех строковых узлах документа, включая элементы массивов
 * (например, `server.command`), заменяются шаблоны:
 *  - `$ENV{VAR}` значением переменной VAR
 *  - `$ENV{VAR:-default}` значением VAR или строкой default, если VAR не задана
 *
 * @warning Шаблон без значения по умолчанию остается без изменений, если
 * переменная не задана
 */

#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

class EnvironmentProcessor {
 public:
  /**
   * @brief Выполнить подстановку во всем документе
   * @param[in,out] config JSON-объект для обработки
   *
   * @code
   nlohmann::json cfg = R"({"pid_file": "$ENV{XDG_RUNTIME_DIR:-/tmp}/web.pid"})"_json;
   EnvironmentProcessor ep;
   ep.process(cfg);
   @endcode
   */
  void process(nlohmann::json &config) const;

  void resolveVariable(std::string &value) const;

 private:
  void walkJson(nlohmann::json &node,
                const std::function<void(std::string &)> &func) const;
};
