/**
 * @file configloader.hpp
 * @author Artem Ulyanov
 * @company STC Ltd.
 * @date October 2026
 * @brief Загрузчик конфигураций из JSON-файлов
 *
 * @details
 * Читает JSON-файл конфигурации супервизора целиком и разбирает его
 * библиотекой nlohmann/json. Ошибки ввода-вывода и синтаксиса сообщаются
 * исключением std::runtime_error с указанием файла и позиции.
 *
 * @version 2.0
 * @see ConfigManager
 */

#pragma once
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

/**
 * @class ConfigLoader
 * @brief Загрузчик конфигураций из JSON-файлов
 *
 * @note Класс не является потокобезопасным
 */
class ConfigLoader {
 public:
  /**
   * @brief Загрузить конфигурацию из файла
   * @param[in] filename Путь к JSON-файлу
   * @return Разобранный JSON-документ
   * @throw std::runtime_error Если файл не открывается или JSON некорректен
   *
   * @code
   ConfigLoader loader;
   auto cfg = loader.loadFromFile("webctl.json");
   @endcode
   */
  nlohmann::json loadFromFile(const std::string &filename);

  std::string getLastLoadedFile() const;

 private:
  nlohmann::json readFileContents(const std::string &filename) const;

  std::string lastLoadedFile;
};
