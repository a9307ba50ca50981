/**
 * @file environment.hpp
 * @date October 2026
 * @brief Доступ к уже разрешённым значениям конфигурации
 *
 * @details
 * Environment: источник значений вида "lfs.concurrenttransfers" для
 * настройки реестра адаптеров и для загрузчика пользовательских адаптеров.
 * Разбор логических и целых значений следует соглашениям git config.
 */

#pragma once

#include <map>
#include <optional>
#include <string>

namespace lfs {

/**
 * @class Environment
 * @brief Интерфейс чтения конфигурации
 *
 * @ingroup Configuration
 */
class Environment {
 public:
  virtual ~Environment() = default;

  /**
     * @brief Возвращает значение ключа
     * @return std::nullopt, если ключ не задан
     */
  virtual std::optional<std::string> get(const std::string& key) const = 0;

  /**
     * @brief Логическое значение ключа
     *
     * @details
     *  - ключ отсутствует или пуст: def
     *  - "true", "1", "on", "yes", "t": true
     *  - "false", "0", "off", "no", "f": false
     *  - любое другое значение: false
     *
     * Сравнение без учёта регистра.
     */
  virtual bool getBool(const std::string& key, bool def) const;

  /**
     * @brief Целое значение ключа
     * @return def, если ключ отсутствует, пуст или не является десятичным
     *         целым в диапазоне int
     */
  virtual int getInt(const std::string& key, int def) const;

  /// Все пары ключ/значение
  virtual std::map<std::string, std::string> all() const = 0;
};

/// Разбор логического значения по правилам Environment::getBool()
bool parseGitBool(const std::string& value, bool def);

/// Разбор целого значения по правилам Environment::getInt()
int parseGitInt(const std::string& value, int def);

/**
 * @class MapEnvironment
 * @brief Environment поверх словаря в памяти
 *
 * @note Методы set()/unset() не синхронизированы: заполняйте словарь до
 *       передачи объекта другим потокам.
 */
class MapEnvironment : public Environment {
 public:
  MapEnvironment() = default;
  explicit MapEnvironment(std::map<std::string, std::string> values);

  std::optional<std::string> get(const std::string& key) const override;
  std::map<std::string, std::string> all() const override;

  void set(const std::string& key, const std::string& value);
  void unset(const std::string& key);

 private:
  std::map<std::string, std::string> values_;
};

}  // namespace lfs
