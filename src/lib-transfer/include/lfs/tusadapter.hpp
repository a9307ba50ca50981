/**
 * @file tusadapter.hpp
 * @date October 2026
 * @brief Адаптер возобновляемой выгрузки tus
 */

#pragma once

#include "lfs/adapterbase.hpp"

namespace lfs {

class Manifest;

/**
 * @class TusAdapter
 * @brief Адаптер возобновляемой выгрузки по протоколу tus.io
 *
 * @note Существует только для направления Upload; регистрируется, если
 *       Manifest::tusTransfersAllowed() == true.
 */
class TusAdapter : public AdapterBase {
 public:
  TusAdapter(const std::string& name, Direction dir);
};

void configureTusAdapter(Manifest& manifest);

}  // namespace lfs
