/**
 * @file gitconfiguration.hpp
 * @date October 2026
 * @brief Чтение и запись git config в выбранной области видимости
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace lfs {

/// Область видимости git config
enum class ConfigScope { Local, Worktree, System, Global };

/// Флаг командной строки git для области: "--local", "--global", ...
std::string scopeFlag(ConfigScope scope);

/**
 * @class GitConfigError
 * @brief Ошибка выполнения git config
 */
class GitConfigError : public std::runtime_error {
 public:
  GitConfigError(const std::string& message, int exitStatus)
      : std::runtime_error(message), exitStatus_(exitStatus) {}

  int exitStatus() const noexcept { return exitStatus_; }

 private:
  int exitStatus_;
};

/**
 * @class GitConfiguration
 * @brief Интерфейс доступа к git config
 *
 * @ingroup Installer
 */
class GitConfiguration {
 public:
  virtual ~GitConfiguration() = default;

  /// Значение ключа, пустая строка если ключ не задан
  virtual std::string find(ConfigScope scope, const std::string& key) = 0;

  virtual void set(ConfigScope scope, const std::string& key,
                   const std::string& value) = 0;

  /// Удаляет секцию целиком. Отсутствующая секция не считается ошибкой.
  virtual void unsetSection(ConfigScope scope, const std::string& section) = 0;
};

/**
 * @class GitCommandConfiguration
 * @brief GitConfiguration через дочерний процесс `git config`
 *
 * @details
 * Каждая операция запускает git через fork()/execvp() и собирает stdout и
 * stderr. Ненулевой код возврата, кроме "ключ не найден", превращается в
 * GitConfigError с текстом stderr.
 *
 * @code
 * lfs::GitCommandConfiguration git;
 * git.set(lfs::ConfigScope::Global, "filter.lfs.required", "true");
 * @endcode
 */
class GitCommandConfiguration : public GitConfiguration {
 public:
  struct CommandResult {
    int status = 0;
    std::string out;
    std::string err;
  };

  explicit GitCommandConfiguration(std::string gitBinary = "git");

  std::string find(ConfigScope scope, const std::string& key) override;
  void set(ConfigScope scope, const std::string& key,
           const std::string& value) override;
  void unsetSection(ConfigScope scope, const std::string& section) override;

 protected:
  /**
     * @brief Запускает git с аргументами args (без имени программы)
     * @throw std::system_error Не удалось создать канал или процесс
     */
  virtual CommandResult run(const std::vector<std::string>& args);

 private:
  [[noreturn]] void fail(const std::vector<std::string>& args,
                         const CommandResult& result) const;

  std::string gitBinary_;
};

}  // namespace lfs
