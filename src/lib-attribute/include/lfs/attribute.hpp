/**
 * @file attribute.hpp
 * @date October 2026
 * @brief Установка и удаление секции фильтра в git config
 *
 * @details
 * Attribute описывает секцию git config (например "filter.lfs") с набором
 * желаемых значений. Для каждого свойства можно указать устаревшие значения,
 * которые перезаписываются без флага force.
 */

#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "lfs/gitconfiguration.hpp"

namespace lfs {

/**
 * @class AttributeConflictError
 * @brief Ключ уже задан другим значением, а force не указан
 */
class AttributeConflictError : public std::runtime_error {
 public:
  AttributeConflictError(const std::string& key, const std::string& expected,
                         const std::string& actual);

  const std::string& key() const noexcept { return key_; }
  const std::string& expected() const noexcept { return expected_; }
  const std::string& actual() const noexcept { return actual_; }

 private:
  std::string key_;
  std::string expected_;
  std::string actual_;
};

/**
 * @struct FilterOptions
 * @brief Параметры установки фильтра
 *
 * @details
 * Область видимости выбирается по первому установленному флагу в порядке
 * local, worktree, system. Если ни один не установлен, используется global.
 */
struct FilterOptions {
  GitConfiguration* gitConfig = nullptr;
  bool force = false;
  bool local = false;
  bool worktree = false;
  bool system = false;
  bool skipSmudge = false;

  ConfigScope scope() const;

  /**
     * @brief Устанавливает фильтр для текущего исполняемого файла
     *
     * При skipSmudge используется skipSmudgeFilterAttribute(), иначе
     * filterAttribute().
     *
     * @throw std::invalid_argument gitConfig не задан
     * @throw AttributeConflictError Конфликт значений без force
     * @throw GitConfigError Ошибка git
     */
  void install() const;

  /// Удаляет секцию фильтра в выбранной области
  void uninstall() const;
};

/**
 * @struct Attribute
 * @brief Секция git config и желаемые значения её свойств
 */
struct Attribute {
  /// Секция, например "filter.lfs"
  std::string section;
  /// Свойство -> желаемое значение
  std::map<std::string, std::string> properties;
  /// Свойство -> устаревшие значения, допускающие перезапись
  std::map<std::string, std::vector<std::string>> upgradeables;

  /**
     * @brief Записывает все свойства секции
     *
     * @details
     * Свойства обрабатываются в порядке ключей. Для каждого читается текущее
     * значение. Запись выполняется, если указан force, значение пусто или
     * совпадает с одним из upgradeables. Если значение отличается от
     * желаемого, бросается AttributeConflictError и оставшиеся свойства не
     * записываются. Совпадающее значение не перезаписывается.
     */
  void install(const FilterOptions& options) const;

  /// Удаляет секцию целиком
  void uninstall(const FilterOptions& options) const;

  /// "section.property"
  std::string normalizeKey(const std::string& property) const;
};

/// Стандартный фильтр: clean, smudge, process, required
Attribute filterAttribute(const std::string& executable);
Attribute filterAttribute();

/// Фильтр, пропускающий загрузку содержимого при smudge
Attribute skipSmudgeFilterAttribute(const std::string& executable);
Attribute skipSmudgeFilterAttribute();

}  // namespace lfs
