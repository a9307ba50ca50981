/**
 * @file configloader.hpp
 * @date October 2026
 * @brief Чтение файла конфигурации lfs-transfer
 *
 * @details
 * Файл конфигурации содержит JSON-объект с ключами lfs.*. Допускаются
 * комментарии в стиле C/C++. Ошибка разбора сообщается с номером строки
 * и столбца, чтобы её можно было найти в редакторе.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace lfs {

/**
 * @class ConfigLoader
 * @brief Загрузка JSON-конфигурации из файла
 *
 * @ingroup Configuration
 */
class ConfigLoader {
 public:
  /**
     * @brief Читает и разбирает файл
     *
     * @param filename Путь к JSON-файлу
     * @return Документ, верхний уровень которого является объектом
     * @throw std::runtime_error Файл не открывается, содержит некорректный
     *        JSON или верхний уровень не является объектом
     *
     * @code
     * auto config = lfs::ConfigLoader::loadFromFile("lfs.json");
     * @endcode
     */
  static nlohmann::json loadFromFile(const std::string& filename);

  /**
     * @brief Разбирает уже прочитанный текст
     * @param origin Имя источника для сообщений об ошибках
     */
  static nlohmann::json parse(const std::string& content,
                              const std::string& origin);
};

}  // namespace lfs
