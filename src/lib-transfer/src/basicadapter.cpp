/**
 * @file basicadapter.cpp
 * @date October 2026
 * @brief Встроенный адаптер basic и его регистрация
 */

#include "lfs/basicadapter.hpp"

#include <memory>

#include "lfs/manifest.hpp"

namespace lfs {

BasicAdapter::BasicAdapter(const std::string& name, Direction dir)
    : AdapterBase(name, dir) {}

namespace {

std::unique_ptr<TransferAdapter> newBasicAdapter(const std::string& name,
                                                 Direction dir) {
  return std::make_unique<BasicAdapter>(name, dir);
}

}  // namespace

void configureBasicDownloadAdapter(Manifest& manifest) {
  manifest.registerNewAdapterFunc(kBasicAdapterName, Direction::Download,
                                  newBasicAdapter);
}

void configureBasicUploadAdapter(Manifest& manifest) {
  manifest.registerNewAdapterFunc(kBasicAdapterName, Direction::Upload,
                                  newBasicAdapter);
}

}  // namespace lfs
