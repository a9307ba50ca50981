/**
 * @file ilogger.hpp
 * @date October 2026
 * @brief Базовый интерфейс логгеров lfs-transfer и вспомогательные типы.
 *
 * @details
 * Определяет уровни логирования, форматирование меток времени и
 * абстрактный класс ILogger, от которого наследуются консольный и
 * составной логгеры.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

namespace lfs {

enum class LogLevel {
  LOG_DEBUG,
  LOG_INFO,
  LOG_WARNING,
  LOG_ERROR,
  LOG_CRITICAL
};

/**
 * @class TimeFormatter
 * @brief Форматирование меток времени для всех логгеров процесса
 *
 * @note Формат задаётся в синтаксисе strftime, по умолчанию "%Y-%m-%d %T".
 */
class TimeFormatter {
 public:
  /**
   * @brief Устанавливает глобальный формат меток времени
   * @param[in] fmt Строка формата strftime
   * @return false, если формат пуст или не может быть применён
   */
  static bool setGlobalFormat(const std::string& fmt);

  static std::string format(const std::chrono::system_clock::time_point& tp);

 private:
  static std::string formatWith(const std::chrono::system_clock::time_point& tp,
                                const std::string& fmt);

  inline static std::mutex formatMutex_;
  inline static std::string globalFormat_ = "%Y-%m-%d %T";
};

class ILogger {
 public:
  virtual void init(const LogLevel level) = 0;

  virtual void setLogLevel(LogLevel level) = 0;
  virtual LogLevel getLogLevel() const;

  virtual void debug(const std::string& message);
  virtual void info(const std::string& message);
  virtual void warning(const std::string& message);
  virtual void error(const std::string& message);
  virtual void critical(const std::string& message);

  virtual void flush() = 0;

  virtual ~ILogger() = default;

 protected:
  std::atomic<LogLevel> currentLevel_ = LogLevel::LOG_INFO;
  virtual void log(LogLevel, const std::string&) = 0;
  virtual bool shouldSkipLog(LogLevel level) const = 0;
};

std::string leveltoString(LogLevel level);

/**
 * @brief Разбирает имя уровня ("debug", "info", "warning", "error",
 *        "critical") без учёта регистра
 * @throw std::invalid_argument Для неизвестного имени
 */
LogLevel levelFromString(const std::string& name);

}  // namespace lfs
