/**
 * @file tusadapter.cpp
 * @date October 2026
 * @brief Адаптер возобновляемой выгрузки tus
 */

#include "lfs/tusadapter.hpp"

#include <memory>

#include "lfs/manifest.hpp"

namespace lfs {

TusAdapter::TusAdapter(const std::string& name, Direction dir)
    : AdapterBase(name, dir) {}

void configureTusAdapter(Manifest& manifest) {
  manifest.registerNewAdapterFunc(
      kTusAdapterName, Direction::Upload,
      [](const std::string& name,
         Direction dir) -> std::unique_ptr<TransferAdapter> {
        return std::make_unique<TusAdapter>(name, dir);
      });
}

}  // namespace lfs
