/**
 * @file ilogger.cpp
 * @date October 2026
 * @brief Уровни логирования и форматирование времени
 */

#include "lfs/ilogger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

bool lfs::TimeFormatter::setGlobalFormat(const std::string& fmt) {
  if (fmt.empty()) {
    return false;
  }
  if (formatWith(std::chrono::system_clock::now(), fmt).empty()) {
    return false;
  }
  std::lock_guard<std::mutex> lock(formatMutex_);
  globalFormat_ = fmt;
  return true;
}

std::string lfs::TimeFormatter::format(
    const std::chrono::system_clock::time_point& tp) {
  std::string fmt;
  {
    std::lock_guard<std::mutex> lock(formatMutex_);
    fmt = globalFormat_;
  }
  std::string result = formatWith(tp, fmt);
  return result.empty() ? "[INVALID_TIME]" : result;
}

std::string lfs::TimeFormatter::formatWith(
    const std::chrono::system_clock::time_point& tp, const std::string& fmt) {
  auto time = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  if (localtime_r(&time, &tm) == nullptr) {
    return {};
  }

  std::ostringstream oss;
  oss << std::put_time(&tm, fmt.c_str());
  if (oss.fail()) {
    return {};
  }
  return oss.str();
}

lfs::LogLevel lfs::ILogger::getLogLevel() const {
  return currentLevel_.load(std::memory_order_acquire);
}

void lfs::ILogger::debug(const std::string& message) {
  log(lfs::LogLevel::LOG_DEBUG, message);
}

void lfs::ILogger::info(const std::string& message) {
  log(lfs::LogLevel::LOG_INFO, message);
}

void lfs::ILogger::warning(const std::string& message) {
  log(lfs::LogLevel::LOG_WARNING, message);
}

void lfs::ILogger::error(const std::string& message) {
  log(lfs::LogLevel::LOG_ERROR, message);
}

void lfs::ILogger::critical(const std::string& message) {
  log(lfs::LogLevel::LOG_CRITICAL, message);
}

std::string lfs::leveltoString(LogLevel level) {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return "DEBUG";
    case LogLevel::LOG_INFO:
      return "INFO";
    case LogLevel::LOG_WARNING:
      return "WARNING";
    case LogLevel::LOG_ERROR:
      return "ERROR";
    case LogLevel::LOG_CRITICAL:
      return "CRITICAL";
  }
  return "";
}

lfs::LogLevel lfs::levelFromString(const std::string& name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "debug") return LogLevel::LOG_DEBUG;
  if (lower == "info") return LogLevel::LOG_INFO;
  if (lower == "warning" || lower == "warn") return LogLevel::LOG_WARNING;
  if (lower == "error") return LogLevel::LOG_ERROR;
  if (lower == "critical") return LogLevel::LOG_CRITICAL;

  throw std::invalid_argument("Invalid log level: " + name);
}
