/**
 * @file selfpath.hpp
 * @date October 2026
 * @brief Путь к исполняемому файлу текущего процесса
 */

#pragma once

#include <string>

namespace lfs {

/**
 * @brief Абсолютный путь к исполняемому файлу текущего процесса
 *
 * Значение читается из /proc/self/exe при первом успешном вызове и далее
 * берётся из кэша.
 *
 * @throw std::runtime_error Путь не удалось определить
 */
const std::string& selfPath();

}  // namespace lfs
