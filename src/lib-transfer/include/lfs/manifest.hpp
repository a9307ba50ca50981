/**
 * @file manifest.hpp
 * @date October 2026
 * @brief Реестр и фабрика адаптеров передачи объектов
 *
 * @details
 * Класс Manifest хранит две таблицы фабрик адаптеров (загрузка и выгрузка),
 * позволяет регистрировать новые адаптеры во время выполнения и создаёт
 * экземпляры адаптеров по имени и направлению с откатом на адаптер "basic".
 * Помимо таблиц, Manifest хранит общие параметры передач (лимит повторов,
 * число параллельных передач, флаги), одинаковые для всех создаваемых
 * адаптеров.
 *
 * Ни одна операция реестра не сообщает об ошибке: отсутствие адаптера
 * выражается nullptr (newAdapter) или подстановкой адаптера по умолчанию
 * (newAdapterOrDefault).
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "lfs/direction.hpp"
#include "lfs/environment.hpp"
#include "lfs/transferadapter.hpp"

namespace lfs {

/**
 * @class Manifest
 * @brief Потокобезопасный реестр фабрик адаптеров передачи
 *
 * @ingroup Core
 *
 * @details
 * Жизненный цикл:
 *  1. создание (пустые таблицы, значения по умолчанию);
 *  2. при необходимости настройка параметров (configureManifest() или
 *     сеттеры);
 *  3. initAdapters() / initCustomAdapters();
 *  4. произвольное число registerNewAdapterFunc();
 *  5. произвольное число newAdapter*() и getAdapterNames() из любых потоков.
 *
 * @warning
 * Параметры передач не защищены мьютексом. Завершите настройку и вызовите
 * initAdapters() до того, как объект станет доступен другим потокам. До
 * инициализации геттеры могут вернуть значения < 1, например 0.
 *
 * @note
 * Мьютекс удерживается только на время чтения или записи таблиц и
 * освобождается до вызова фабрики, поэтому фабрика может обращаться к
 * этому же Manifest.
 */
class Manifest {
 public:
  static constexpr int kDefaultMaxRetries = 1;
  static constexpr int kDefaultConcurrentTransfers = 3;

  Manifest();

  Manifest(const Manifest &) = delete;
  Manifest &operator=(const Manifest &) = delete;

  /**
     * @brief Регистрирует встроенные адаптеры
     * @ingroup Registration
     *
     * @details
     *  - maxRetries < 1 заменяется на kDefaultMaxRetries,
     *    concurrentTransfers < 1 на kDefaultConcurrentTransfers
     *  - "basic" регистрируется для обоих направлений
     *  - "tus" регистрируется для выгрузки, если tusTransfersAllowed()
     *
     * Повторный вызов перезаписывает встроенные записи и сохраняет
     * остальные пользовательские регистрации.
     */
  void initAdapters();

  /**
     * @brief initAdapters(), затем регистрация пользовательских адаптеров
     * @ingroup Registration
     *
     * @param[in] env Источник объявлений lfs.customtransfer.<name>.* (in)
     *
     * @note Пользовательские адаптеры регистрируются вторыми и могут
     *       переопределить встроенные по имени.
     */
  void initCustomAdapters(const Environment &env);

  /**
     * @brief Регистрирует фабрику адаптера
     * @ingroup Registration
     *
     * @param[in] name    Имя адаптера (in)
     * @param[in] dir     Таблица, в которую выполняется запись (in)
     * @param[in] factory Функция создания адаптера (in)
     *
     * @details
     * Запись для пары (dir, name) перезаписывается без предупреждений:
     * последняя регистрация побеждает. Пустая фабрика сохраняется и при
     * поиске трактуется как отсутствие адаптера.
     *
     * @code
     manifest.registerNewAdapterFunc("lfs-folder", lfs::Direction::Upload,
         [](const std::string &name, lfs::Direction dir) {
           return std::make_unique<MyAdapter>(name, dir);
         });
     @endcode
     */
  void registerNewAdapterFunc(const std::string &name, Direction dir,
                              AdapterFactory factory);

  /**
     * @brief Имена адаптеров, доступных для создания
     * @ingroup Query
     *
     * @return При basicTransfersOnly() только {"basic"}, иначе ключи
     *         таблицы направления в неопределённом порядке
     */
  std::vector<std::string> getAdapterNames(Direction dir) const;
  std::vector<std::string> getDownloadAdapterNames() const;
  std::vector<std::string> getUploadAdapterNames() const;

  /// true, если для (dir, name) зарегистрирована непустая фабрика
  bool hasAdapter(const std::string &name, Direction dir) const;

  /**
     * @brief Создаёт адаптер по имени и направлению
     * @ingroup Creation
     *
     * @return Новый экземпляр или nullptr, если адаптер не зарегистрирован
     *
     * @details
     * Фабрика вызывается вне блокировки. Кэширования нет: каждый вызов
     * создаёт новый экземпляр. Исключения самой фабрики не перехватываются.
     */
  std::unique_ptr<TransferAdapter> newAdapter(const std::string &name,
                                              Direction dir) const;

  /**
     * @brief Создаёт адаптер, при его отсутствии создаёт "basic"
     * @ingroup Creation
     *
     * @details
     *  - пустое имя заменяется на "basic"
     *  - если newAdapter() вернул nullptr, пишется отладочное сообщение и
     *    создаётся "basic"
     *
     * После initAdapters() результат никогда не равен nullptr.
     */
  std::unique_ptr<TransferAdapter> newAdapterOrDefault(
      const std::string &name, Direction dir) const;

  std::unique_ptr<TransferAdapter> newDownloadAdapter(
      const std::string &name) const;
  std::unique_ptr<TransferAdapter> newUploadAdapter(
      const std::string &name) const;

  int maxRetries() const { return maxRetries_; }
  void setMaxRetries(int value) { maxRetries_ = value; }

  int concurrentTransfers() const { return concurrentTransfers_; }
  void setConcurrentTransfers(int value) { concurrentTransfers_ = value; }

  bool basicTransfersOnly() const { return basicTransfersOnly_; }
  void setBasicTransfersOnly(bool value) { basicTransfersOnly_ = value; }

  bool tusTransfersAllowed() const { return tusTransfersAllowed_; }
  void setTusTransfersAllowed(bool value) { tusTransfersAllowed_ = value; }

 private:
  using FactoryTable = std::unordered_map<std::string, AdapterFactory>;

  /// Таблица направления; nullptr для значения вне перечисления
  FactoryTable *tableFor(Direction dir);
  const FactoryTable *tableFor(Direction dir) const;

  /// Копия фабрики под блокировкой; пустая, если записи нет
  AdapterFactory findFactory(const std::string &name, Direction dir) const;

  int maxRetries_;
  int concurrentTransfers_;
  bool basicTransfersOnly_ = false;
  bool tusTransfersAllowed_ = false;

  FactoryTable downloadFactories_;
  FactoryTable uploadFactories_;

  /// Общий мьютекс обеих таблиц
  mutable std::mutex mutex_;
};

}  // namespace lfs
