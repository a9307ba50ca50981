/**
 * @file adapterbase.hpp
 * @date October 2026
 * @brief Базовая реализация адаптера передачи
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

#include "lfs/transferadapter.hpp"

namespace lfs {

/**
 * @class AdapterBase
 * @brief Общая часть встроенных адаптеров: имя, направление, жизненный цикл
 *
 * @details
 * Наследники переопределяют effectiveConcurrency(), если транспорт
 * ограничивает число параллельных передач.
 *
 * Методы можно вызывать из разных потоков.
 */
class AdapterBase : public TransferAdapter {
 public:
  AdapterBase(std::string name, Direction dir);

  std::string name() const override;
  Direction direction() const override;

  void begin(const AdapterConfig& config) override;
  void end() override;
  bool isStarted() const noexcept override;
  int concurrency() const noexcept override;

  /// Удалённый репозиторий текущего пакета; пуст вне begin()/end()
  std::string remote() const;

 protected:
  virtual int effectiveConcurrency(const AdapterConfig& config) const;

 private:
  const std::string name_;
  const Direction direction_;
  std::atomic<bool> started_{false};
  std::atomic<int> concurrency_{0};
  mutable std::mutex remoteMutex_;
  std::string remote_;
};

}  // namespace lfs
