/**
 * @file argumentparser.hpp
 * @date October 2026
 * @brief Разбор аргументов командной строки lfs-transfer
 *
 * @details
 * Формат:
 * @code
 * lfs-transfer [--log-level LEVEL] [--config-file FILE] <command> [options]
 * @endcode
 * Значения опций принимаются как "--opt value" и как "--opt=value".
 * Любая ошибка разбора сообщается через std::invalid_argument.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "lfs/direction.hpp"

/// Подкоманды lfs-transfer
enum class Command { None, Adapters, Resolve, Install, Uninstall };

struct ParsedArgs {
  bool help = false;
  std::optional<std::string> log_level;
  std::optional<std::string> config_path;

  Command command = Command::None;
  /// Имя адаптера для resolve
  std::string adapter_name;
  std::optional<lfs::Direction> direction;

  bool force = false;
  bool local = false;
  bool worktree = false;
  bool system = false;
  bool skip_smudge = false;
};

class ArgumentParser {
 public:
  /**
     * @brief Разбирает argv
     * @throw std::invalid_argument Неизвестная команда или опция, опция без
     *        значения, недопустимое значение, лишний аргумент
     */
  ParsedArgs parse(int argc, char** argv);

  /// Текст справки
  static std::string usage();

 private:
  static const std::vector<std::string> validLogLevels;

  std::string takeValue(const std::string& arg, const std::string& name,
                        int& i, int argc, char** argv) const;
  void parseLogLevel(const std::string& arg, ParsedArgs& args, int& i,
                     int argc, char** argv);
  void parseDirection(const std::string& arg, ParsedArgs& args, int& i,
                      int argc, char** argv);
  void parseCommandOption(const std::string& arg, ParsedArgs& args, int& i,
                          int argc, char** argv);
  void validate(const ParsedArgs& args) const;
};
