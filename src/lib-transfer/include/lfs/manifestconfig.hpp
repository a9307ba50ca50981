/**
 * @file manifestconfig.hpp
 * @date October 2026
 * @brief Ключи конфигурации реестра адаптеров
 */

#pragma once

#include "lfs/environment.hpp"
#include "lfs/manifest.hpp"

namespace lfs {

/// Ключи конфигурации параметров передач
inline constexpr const char* kMaxRetriesKey = "lfs.transfer.maxretries";
inline constexpr const char* kConcurrentTransfersKey =
    "lfs.concurrenttransfers";
inline constexpr const char* kBasicTransfersOnlyKey = "lfs.basictransfersonly";
inline constexpr const char* kTusTransfersKey = "lfs.tustransfers";

/**
 * @brief Переносит параметры передач из конфигурации в Manifest
 *
 * @details
 * Отсутствующие ключи оставляют текущие значения. Ограничение снизу не
 * выполняется: его применяет Manifest::initAdapters().
 */
void configureManifest(Manifest& manifest, const Environment& env);

}  // namespace lfs
