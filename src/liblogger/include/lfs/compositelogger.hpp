/**
 * @file compositelogger.hpp
 * @date October 2026
 * @brief Логгер-агрегатор, рассылающий сообщения во вложенные логгеры
 */

#pragma once

#include "lfs/ilogger.hpp"
#include <initializer_list>
#include <memory>
#include <vector>

namespace lfs {

/**
 * @class CompositeLogger
 * @brief Точка входа логирования библиотек lfs-transfer
 *
 * @details
 * Рассылает каждое сообщение всем зарегистрированным логгерам. Фильтрация
 * по уровню выполняется вложенными логгерами. Без зарегистрированных
 * логгеров сообщения отбрасываются.
 *
 * @note Потокобезопасен: список логгеров копируется под мьютексом,
 *       вызовы вложенных логгеров выполняются без удержания блокировки.
 */
class CompositeLogger : public ILogger {
 public:
  static CompositeLogger& instance();

  CompositeLogger(const CompositeLogger&) = delete;
  CompositeLogger& operator=(const CompositeLogger&) = delete;

  void addLogger(const std::shared_ptr<ILogger>& logger);
  void removeLogger(const std::shared_ptr<ILogger>& logger);
  void clearLoggers();
  std::size_t loggerCount() const;

  void init(const LogLevel level) override;

  void setLogLevel(LogLevel level) override;

  void flush() override;

  void debug(const std::string& message) override;
  void info(const std::string& message) override;
  void warning(const std::string& message) override;
  void error(const std::string& message) override;
  void critical(const std::string& message) override;

 protected:
  bool shouldSkipLog(LogLevel level) const override;
  void log(LogLevel level, const std::string& message) override;

 private:
  CompositeLogger() = default;
  ~CompositeLogger() override = default;

  std::vector<std::shared_ptr<ILogger>> snapshot() const;

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<ILogger>> loggers_;
};

}  // namespace lfs
