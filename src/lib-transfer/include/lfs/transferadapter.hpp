/**
 * @file transferadapter.hpp
 * @date October 2026
 * @brief Абстрактный интерфейс адаптера передачи объектов
 *
 * @details
 * TransferAdapter определяет контракт стратегий перемещения объектов между
 * локальным клиентом и удалённым хранилищем (basic HTTP, tus, внешние
 * агенты). Реестр адаптеров (Manifest) хранит только фабрики и никогда не
 * обращается к созданным адаптерам: их использует подсистема выполнения
 * передач.
 */

#pragma once

#include <functional>
#include <memory>
#include <string>

#include "lfs/direction.hpp"

namespace lfs {

/// Имя универсального адаптера по умолчанию
inline constexpr const char* kBasicAdapterName = "basic";

/// Имя адаптера возобновляемой выгрузки
inline constexpr const char* kTusAdapterName = "tus";

/**
 * @struct AdapterConfig
 * @brief Параметры запуска адаптера, передаваемые в begin()
 */
struct AdapterConfig {
  /// Желаемое число параллельных передач; значения < 1 трактуются как 1
  int concurrentTransfers = 1;

  /// Имя удалённого репозитория, для которого открыт пакет передач
  std::string remote;
};

/**
 * @class TransferAdapter
 * @brief Интерфейс стратегии передачи
 *
 * @details
 * Экземпляр создаётся фабрикой для одного пакета передач: begin() перед
 * первой передачей, end() после последней.
 */
class TransferAdapter {
 public:
  virtual ~TransferAdapter() = default;

  /// Имя, под которым адаптер был запрошен у реестра
  virtual std::string name() const = 0;

  virtual Direction direction() const = 0;

  /**
     * @brief Подготавливает адаптер к пакету передач
     * @ingroup Lifecycle
     *
     * @param[in] config Параметры пакета (in)
     * @throw std::logic_error При повторном вызове без end()
     *
     * @details
     * Реализация определяет эффективное число параллельных передач исходя
     * из config.concurrentTransfers и собственных ограничений.
     */
  virtual void begin(const AdapterConfig& config) = 0;

  /**
     * @brief Завершает пакет передач
     * @ingroup Lifecycle
     *
     * @note Вызов на незапущенном адаптере ничего не делает
     */
  virtual void end() = 0;

  virtual bool isStarted() const noexcept = 0;

  /// Эффективное число параллельных передач; 0 до вызова begin()
  virtual int concurrency() const noexcept = 0;
};

/**
 * @typedef AdapterFactory
 * @brief Функция создания адаптера по имени и направлению
 *
 * @details
 * Может вызываться многократно и одновременно из разных потоков; каждый
 * вызов должен быть независимым. nullptr означает «адаптер недоступен».
 */
using AdapterFactory = std::function<std::unique_ptr<TransferAdapter>(
    const std::string& name, Direction dir)>;

}  // namespace lfs
