/**
 * @file jsonenvironment.cpp
 * @date October 2026
 * @brief Преобразование JSON-конфигурации в ключи git config
 */

#include "lfs/jsonenvironment.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>

#include "lfs/compositelogger.hpp"
#include "lfs/configloader.hpp"

namespace lfs {

namespace {

const std::string kEnvPrefix = "$ENV{";

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

std::optional<std::string> scalarToString(const nlohmann::json& value) {
  if (value.is_string()) {
    return JsonEnvironment::expandVariables(value.get<std::string>());
  }
  if (value.is_boolean()) {
    return value.get<bool>() ? "true" : "false";
  }
  if (value.is_number_unsigned()) {
    return std::to_string(value.get<unsigned long long>());
  }
  if (value.is_number_integer()) {
    return std::to_string(value.get<long long>());
  }
  if (value.is_number()) {
    return value.dump();
  }
  return std::nullopt;
}

}  // namespace

JsonEnvironment::JsonEnvironment(const nlohmann::json& document) {
  if (!document.is_object()) {
    if (!document.is_null()) {
      CompositeLogger::instance().warning(
          "JsonEnvironment: top-level value is not an object, ignoring");
    }
    return;
  }
  flatten("", document);
}

JsonEnvironment JsonEnvironment::fromFile(const std::string& path) {
  JsonEnvironment env(ConfigLoader::loadFromFile(path));
  CompositeLogger::instance().debug("Loaded " +
                                    std::to_string(env.all().size()) +
                                    " configuration keys from " + path);
  return env;
}

std::string JsonEnvironment::canonicalKey(const std::string& key) {
  const size_t first = key.find('.');
  if (first == std::string::npos) {
    return toLower(key);
  }
  const size_t last = key.rfind('.');
  return toLower(key.substr(0, first)) + key.substr(first, last - first) +
         toLower(key.substr(last));
}

std::string JsonEnvironment::expandVariables(const std::string& value) {
  std::string result;
  size_t pos = 0;

  while (pos < value.size()) {
    size_t start = value.find(kEnvPrefix, pos);
    if (start == std::string::npos) break;

    size_t close = value.find('}', start + kEnvPrefix.size());
    if (close == std::string::npos) break;

    result.append(value, pos, start - pos);
    const std::string name =
        value.substr(start + kEnvPrefix.size(),
                     close - start - kEnvPrefix.size());
    if (const char* resolved = std::getenv(name.c_str())) {
      result += resolved;
    } else {
      result.append(value, start, close - start + 1);
    }
    pos = close + 1;
  }

  result.append(value, std::min(pos, value.size()), std::string::npos);
  return result;
}

void JsonEnvironment::flatten(const std::string& prefix,
                              const nlohmann::json& node) {
  for (const auto& [key, value] : node.items()) {
    const std::string fullKey = prefix.empty() ? key : prefix + "." + key;

    if (value.is_object()) {
      flatten(fullKey, value);
    } else {
      emit(fullKey, value);
    }
  }
}

void JsonEnvironment::emit(const std::string& key,
                           const nlohmann::json& value) {
  const nlohmann::json* scalar = &value;

  // Для массива действует последнее скалярное значение, как при повторе
  // ключа в git config
  if (value.is_array()) {
    auto it = std::find_if(value.rbegin(), value.rend(),
                           [](const nlohmann::json& element) {
                             return element.is_primitive() &&
                                    !element.is_null();
                           });
    if (it == value.rend()) return;
    scalar = &*it;
  }

  if (auto text = scalarToString(*scalar)) {
    set(canonicalKey(key), *text);
  }
}

}  // namespace lfs
