/**
 * @file manifest.cpp
 * @date October 2026
 * @brief Реализация реестра адаптеров передачи
 */

#include "lfs/manifest.hpp"

#include <utility>

#include "lfs/basicadapter.hpp"
#include "lfs/compositelogger.hpp"
#include "lfs/customadapter.hpp"
#include "lfs/tusadapter.hpp"

namespace lfs {

Manifest::Manifest()
    : maxRetries_(kDefaultMaxRetries),
      concurrentTransfers_(kDefaultConcurrentTransfers) {}

void Manifest::initAdapters() {
  if (maxRetries_ < 1) {
    maxRetries_ = kDefaultMaxRetries;
  }
  if (concurrentTransfers_ < 1) {
    concurrentTransfers_ = kDefaultConcurrentTransfers;
  }

  configureBasicDownloadAdapter(*this);
  configureBasicUploadAdapter(*this);
  if (tusTransfersAllowed_) {
    configureTusAdapter(*this);
  }

  CompositeLogger::instance().debug(
      "tq: adapters initialized, max retries " + std::to_string(maxRetries_) +
      ", concurrent transfers " + std::to_string(concurrentTransfers_));
}

void Manifest::initCustomAdapters(const Environment &env) {
  initAdapters();
  configureCustomAdapters(env, *this);
}

std::vector<std::string> Manifest::getAdapterNames(Direction dir) const {
  if (basicTransfersOnly_) {
    return {kBasicAdapterName};
  }

  std::lock_guard<std::mutex> lock(mutex_);

  const FactoryTable *table = tableFor(dir);
  if (table == nullptr) {
    return {};
  }

  std::vector<std::string> names;
  names.reserve(table->size());
  for (const auto &[name, factory] : *table) {
    names.push_back(name);
  }
  return names;
}

std::vector<std::string> Manifest::getDownloadAdapterNames() const {
  return getAdapterNames(Direction::Download);
}

std::vector<std::string> Manifest::getUploadAdapterNames() const {
  return getAdapterNames(Direction::Upload);
}

void Manifest::registerNewAdapterFunc(const std::string &name, Direction dir,
                                      AdapterFactory factory) {
  {
    std::lock_guard<std::mutex> lock(mutex_);

    FactoryTable *table = tableFor(dir);
    if (table == nullptr) {
      return;
    }
    (*table)[name] = std::move(factory);
  }

  CompositeLogger::instance().debug("tq: registered " + toString(dir) +
                                    " adapter \"" + name + "\"");
}

bool Manifest::hasAdapter(const std::string &name, Direction dir) const {
  return static_cast<bool>(findFactory(name, dir));
}

std::unique_ptr<TransferAdapter> Manifest::newAdapter(const std::string &name,
                                                      Direction dir) const {
  AdapterFactory factory = findFactory(name, dir);
  if (!factory) {
    return nullptr;
  }
  return factory(name, dir);
}

std::unique_ptr<TransferAdapter> Manifest::newAdapterOrDefault(
    const std::string &name, Direction dir) const {
  const std::string requested = name.empty() ? kBasicAdapterName : name;

  auto adapter = newAdapter(requested, dir);
  if (!adapter) {
    CompositeLogger::instance().debug(
        "Defaulting to basic transfer adapter since \"" + requested +
        "\" did not exist");
    adapter = newAdapter(kBasicAdapterName, dir);
  }
  return adapter;
}

std::unique_ptr<TransferAdapter> Manifest::newDownloadAdapter(
    const std::string &name) const {
  return newAdapterOrDefault(name, Direction::Download);
}

std::unique_ptr<TransferAdapter> Manifest::newUploadAdapter(
    const std::string &name) const {
  return newAdapterOrDefault(name, Direction::Upload);
}

Manifest::FactoryTable *Manifest::tableFor(Direction dir) {
  switch (dir) {
    case Direction::Upload:
      return &uploadFactories_;
    case Direction::Download:
      return &downloadFactories_;
  }
  return nullptr;
}

const Manifest::FactoryTable *Manifest::tableFor(Direction dir) const {
  switch (dir) {
    case Direction::Upload:
      return &uploadFactories_;
    case Direction::Download:
      return &downloadFactories_;
  }
  return nullptr;
}

AdapterFactory Manifest::findFactory(const std::string &name,
                                     Direction dir) const {
  std::lock_guard<std::mutex> lock(mutex_);

  const FactoryTable *table = tableFor(dir);
  if (table == nullptr) {
    return {};
  }

  auto it = table->find(name);
  if (it == table->end()) {
    return {};
  }
  return it->second;
}

}  // namespace lfs
