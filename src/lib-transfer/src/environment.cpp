/**
 * @file environment.cpp
 * @date October 2026
 * @brief Разбор логических и целых значений по правилам git config
 */

#include "lfs/environment.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <utility>

namespace lfs {

bool parseGitBool(const std::string& value, bool def) {
  if (value.empty()) {
    return def;
  }

  std::string lower(value);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "true" || lower == "1" || lower == "on" || lower == "yes" ||
      lower == "t") {
    return true;
  }
  return false;
}

int parseGitInt(const std::string& value, int def) {
  if (value.empty()) {
    return def;
  }

  const char* begin = value.c_str();
  char* end = nullptr;
  errno = 0;
  long parsed = std::strtol(begin, &end, 10);

  if (end == begin || *end != '\0' || errno == ERANGE ||
      std::isspace(static_cast<unsigned char>(value.front())) ||
      parsed < INT_MIN || parsed > INT_MAX) {
    return def;
  }
  return static_cast<int>(parsed);
}

bool Environment::getBool(const std::string& key, bool def) const {
  auto value = get(key);
  return value ? parseGitBool(*value, def) : def;
}

int Environment::getInt(const std::string& key, int def) const {
  auto value = get(key);
  return value ? parseGitInt(*value, def) : def;
}

MapEnvironment::MapEnvironment(std::map<std::string, std::string> values)
    : values_(std::move(values)) {}

std::optional<std::string> MapEnvironment::get(const std::string& key) const {
  auto it = values_.find(key);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::map<std::string, std::string> MapEnvironment::all() const {
  return values_;
}

void MapEnvironment::set(const std::string& key, const std::string& value) {
  values_[key] = value;
}

void MapEnvironment::unset(const std::string& key) { values_.erase(key); }

}  // namespace lfs
