/**
 * @file basicadapter.hpp
 * @date October 2026
 * @brief Встроенный адаптер basic
 */

#pragma once

#include "lfs/adapterbase.hpp"

namespace lfs {

class Manifest;

/**
 * @class BasicAdapter
 * @brief Адаптер обычной передачи по HTTP
 *
 * @details
 * Универсальный адаптер, доступный в обоих направлениях после
 * инициализации реестра. Используется как адаптер по умолчанию, когда
 * запрошенный адаптер не зарегистрирован.
 */
class BasicAdapter : public AdapterBase {
 public:
  BasicAdapter(const std::string& name, Direction dir);
};

/// Регистрирует "basic" в таблице загрузки
void configureBasicDownloadAdapter(Manifest& manifest);

/// Регистрирует "basic" в таблице выгрузки
void configureBasicUploadAdapter(Manifest& manifest);

}  // namespace lfs
