/**
 * @file direction.hpp
 * @date October 2026
 * @brief Направление передачи объектов: выгрузка или загрузка
 */

#pragma once

#include <ostream>
#include <string>

namespace lfs {

/**
 * @enum Direction
 * @brief Пространство имён адаптеров в реестре
 *
 * @details
 * Каждое направление имеет собственную таблицу фабрик: одно и то же имя
 * адаптера в разных направлениях может соответствовать разным фабрикам.
 */
enum class Direction { Upload, Download };

/// "upload" / "download"; для значения вне перечисления возвращает "unknown"
std::string toString(Direction dir);

/**
 * @brief Разбирает "upload" или "download" без учёта регистра
 * @throw std::invalid_argument Для любого другого значения
 */
Direction directionFromString(const std::string& value);

std::ostream& operator<<(std::ostream& os, Direction dir);

}  // namespace lfs
