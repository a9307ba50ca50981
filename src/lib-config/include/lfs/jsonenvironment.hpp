/**
 * @file jsonenvironment.hpp
 * @date October 2026
 * @brief Environment, построенный из JSON-документа
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "lfs/environment.hpp"

namespace lfs {

/**
 * @class JsonEnvironment
 * @brief Плоское представление JSON-конфигурации в виде ключей git config
 *
 * @details
 * Правила преобразования:
 *  - вложенные объекты склеиваются через точку:
 *    {"lfs": {"concurrenttransfers": 8}} -> "lfs.concurrenttransfers";
 *  - ключи, уже содержащие точки, используются как есть;
 *  - первая и последняя части ключа приводятся к нижнему регистру, как имена
 *    секций и переменных в git; средняя часть (имя подсекции) сохраняется:
 *    "LFS.customtransfer.MyAgent.Path" -> "lfs.customtransfer.MyAgent.path";
 *  - строки копируются, $ENV{VAR} заменяется значением переменной
 *    окружения, если она задана;
 *  - bool -> "true"/"false", целые -> десятичная запись,
 *    прочие числа -> JSON-представление;
 *  - из массива берётся последний скалярный элемент;
 *  - null пропускается.
 */
class JsonEnvironment : public MapEnvironment {
 public:
  explicit JsonEnvironment(const nlohmann::json& document);

  /**
     * @brief Загружает документ из файла через ConfigLoader
     * @throw std::runtime_error Файл не открывается или не разбирается
     */
  static JsonEnvironment fromFile(const std::string& path);

  /// Ключ в каноническом виде git config
  static std::string canonicalKey(const std::string& key);

  /// Подставляет значения $ENV{VAR}; незаданные переменные остаются как есть
  static std::string expandVariables(const std::string& value);

 private:
  void flatten(const std::string& prefix, const nlohmann::json& node);
  void emit(const std::string& key, const nlohmann::json& value);
};

}  // namespace lfs
