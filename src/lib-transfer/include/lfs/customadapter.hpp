/**
 * @file customadapter.hpp
 * @date October 2026
 * @brief Адаптер внешнего агента передачи и загрузчик его объявлений
 *
 * @details
 * Пользовательские адаптеры объявляются в конфигурации ключами
 * @code
 * lfs.customtransfer.<name>.path        путь к агенту (обязателен)
 * lfs.customtransfer.<name>.args        аргументы агента
 * lfs.customtransfer.<name>.concurrent  bool, по умолчанию true
 * lfs.customtransfer.<name>.direction   upload | download | both (по умолчанию)
 * @endcode
 */

#pragma once

#include <string>

#include "lfs/adapterbase.hpp"
#include "lfs/environment.hpp"

namespace lfs {

class Manifest;

/**
 * @class CustomAdapter
 * @brief Описание внешнего процесса-агента передачи
 *
 * @details
 * Адаптер не запускает процесс сам: command() отдаёт подсистеме выполнения
 * командную строку агента. Агент без поддержки параллельной работы
 * получает ровно одну передачу одновременно.
 */
class CustomAdapter : public AdapterBase {
 public:
  CustomAdapter(const std::string& name, Direction dir, std::string path,
                std::string args, bool concurrent);

  const std::string& path() const { return path_; }
  const std::string& args() const { return args_; }
  bool isConcurrent() const { return concurrent_; }

  /// path, за которым через пробел следуют args, если они заданы
  std::string command() const;

 protected:
  int effectiveConcurrency(const AdapterConfig& config) const override;

 private:
  std::string path_;
  std::string args_;
  bool concurrent_;
};

/**
 * @brief Регистрирует в реестре адаптеры, объявленные в конфигурации
 *
 * @param[in]     env      Источник ключей lfs.customtransfer.* (in)
 * @param[in,out] manifest Реестр, куда выполняется регистрация (in,out)
 *
 * @details
 * Объявление с пустым путём или неизвестным направлением пропускается с
 * предупреждением в лог.
 */
void configureCustomAdapters(const Environment& env, Manifest& manifest);

}  // namespace lfs
