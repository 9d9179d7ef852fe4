/**
 * @file PortRegistry.hpp
 * @brief Хранение последнего выбранного порта между перезапусками
 *
 * @author Artem Ulyanov
 * @date October 2026
 * @version 1.0
 * @license MIT
 */
#pragma once

#include <filesystem>
#include <optional>

#include "webctl/PortRange.hpp"

namespace webctl {

/**
 * @class PortRegistry
 * @brief Файл с номером порта, выбранного при последнем запуске
 *
 * @details Содержимое файла: десятичный номер порта. Значение вне
 * настроенного диапазона или не являющееся числом считается отсутствующим.
 * Файл не удаляется: устаревшее значение просто перепроверяется при
 * следующем чтении.
 */
class PortRegistry {
 public:
  PortRegistry(std::filesystem::path path, PortRange range);

  /**
   * @brief Записать порт, создав родительский каталог при необходимости
   * @throw std::system_error При ошибке создания каталога или записи
   */
  void write(int port);

  /// Порт из файла; std::nullopt если файла нет, он не число или вне диапазона
  std::optional<int> read() const;

  const std::filesystem::path& path() const { return path_; }
  const PortRange& range() const { return range_; }

 private:
  std::filesystem::path path_;
  PortRange range_;
};

}  // namespace webctl
