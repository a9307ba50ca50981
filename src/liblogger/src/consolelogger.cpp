/**
 * @file consolelogger.cpp
 * @date October 2026
 * @brief Вывод журнала в stderr
 */

#include "lfs/consolelogger.hpp"

#include <unistd.h>

#include <iostream>
#include <sstream>

lfs::ConsoleLogger& lfs::ConsoleLogger::instance() {
  static lfs::ConsoleLogger instance;
  return instance;
}

void lfs::ConsoleLogger::init(const LogLevel level) {
  setLogLevel(level);
  setColorsEnabled(isatty(STDERR_FILENO) == 1);
}

void lfs::ConsoleLogger::setLogLevel(lfs::LogLevel level) {
  currentLevel_.store(level, std::memory_order_release);
}

void lfs::ConsoleLogger::setColorsEnabled(bool enabled) {
  colorsEnabled_.store(enabled, std::memory_order_release);
}

void lfs::ConsoleLogger::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr.flush();
}

void lfs::ConsoleLogger::log(LogLevel level, const std::string& message) {
  if (shouldSkipLog(level)) return;

  std::ostringstream formatted;
  formatted << TimeFormatter::format(std::chrono::system_clock::now()) << " ["
            << leveltoString(level) << "] " << message;

  const bool colored = colorsEnabled_.load(std::memory_order_acquire);

  std::lock_guard<std::mutex> lock(mutex_);
  if (colored) {
    std::cerr << colorCode(level) << formatted.str() << LFS_ANSI_COLOR_RESET
              << '\n';
  } else {
    std::cerr << formatted.str() << '\n';
  }
}

bool lfs::ConsoleLogger::shouldSkipLog(LogLevel level) const {
  return static_cast<int>(level) <
         static_cast<int>(currentLevel_.load(std::memory_order_acquire));
}

const char* lfs::ConsoleLogger::colorCode(LogLevel level) {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return "\033[36m";  // Cyan
    case LogLevel::LOG_INFO:
      return "\033[32m";  // Green
    case LogLevel::LOG_WARNING:
      return "\033[33m";  // Yellow
    case LogLevel::LOG_ERROR:
      return "\033[31m";  // Red
    case LogLevel::LOG_CRITICAL:
      return "\033[41m\033[37m";  // White on Red
  }
  return LFS_ANSI_COLOR_RESET;
}
