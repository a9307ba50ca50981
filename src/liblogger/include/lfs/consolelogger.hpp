/**
 * @file consolelogger.hpp
 * @date October 2026
 * @brief Логгер в стандартный поток ошибок
 */

#pragma once

#include "lfs/ilogger.hpp"

#define LFS_ANSI_COLOR_RESET "\033[0m"

namespace lfs {

/**
 * @class ConsoleLogger
 * @brief Логгер в стандартный поток ошибок
 *
 * @details
 * Формат строки: "<время> [УРОВЕНЬ] сообщение". Цветовое выделение
 * уровней включается в init(), только если stderr является терминалом.
 * Стандартный вывод остаётся свободным для результатов команд.
 */
class ConsoleLogger : public ILogger {
 public:
  static ConsoleLogger& instance();

  void init(const LogLevel level) override;
  void setLogLevel(LogLevel level) override;
  void setColorsEnabled(bool enabled);
  void flush() override;

 protected:
  ConsoleLogger() = default;
  ~ConsoleLogger() override = default;
  void log(LogLevel level, const std::string& message) override;
  bool shouldSkipLog(LogLevel level) const override;

 private:
  static const char* colorCode(LogLevel level);

  mutable std::mutex mutex_;
  std::atomic<bool> colorsEnabled_{false};
};

}  // namespace lfs
