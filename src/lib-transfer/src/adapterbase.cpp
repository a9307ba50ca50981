/**
 * @file adapterbase.cpp
 * @date October 2026
 * @brief Жизненный цикл begin()/end() встроенных адаптеров
 */

#include "lfs/adapterbase.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "lfs/compositelogger.hpp"

namespace lfs {

AdapterBase::AdapterBase(std::string name, Direction dir)
    : name_(std::move(name)), direction_(dir) {}

std::string AdapterBase::name() const { return name_; }

Direction AdapterBase::direction() const { return direction_; }

void AdapterBase::begin(const AdapterConfig& config) {
  bool expected = false;
  if (!started_.compare_exchange_strong(expected, true)) {
    throw std::logic_error("Adapter " + name_ + " (" + toString(direction_) +
                           ") already started");
  }

  {
    std::lock_guard<std::mutex> lock(remoteMutex_);
    remote_ = config.remote;
  }
  concurrency_.store(effectiveConcurrency(config));

  CompositeLogger::instance().debug(
      "xfer: adapter \"" + name_ + "\" Begin() with " +
      std::to_string(concurrency_.load()) + " workers");
}

void AdapterBase::end() {
  if (!started_.exchange(false)) {
    return;
  }
  concurrency_.store(0);
  {
    std::lock_guard<std::mutex> lock(remoteMutex_);
    remote_.clear();
  }
  CompositeLogger::instance().debug("xfer: adapter \"" + name_ +
                                    "\" End()");
}

bool AdapterBase::isStarted() const noexcept { return started_.load(); }

int AdapterBase::concurrency() const noexcept { return concurrency_.load(); }

std::string AdapterBase::remote() const {
  std::lock_guard<std::mutex> lock(remoteMutex_);
  return remote_;
}

int AdapterBase::effectiveConcurrency(const AdapterConfig& config) const {
  return std::max(1, config.concurrentTransfers);
}

}  // namespace lfs
