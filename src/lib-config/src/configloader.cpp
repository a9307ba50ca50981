/**
 * @file configloader.cpp
 * @date October 2026
 * @brief Чтение и разбор файла конфигурации
 */

#include "lfs/configloader.hpp"

#include <algorithm>
#include <cstddef>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

namespace lfs {

namespace {

// Строка и столбец (с единицы) для смещения в байтах
std::pair<size_t, size_t> lineAndColumn(const std::string& content,
                                        size_t offset) {
  offset = std::min(offset, content.size());
  auto begin = content.begin();
  auto end = begin + static_cast<std::ptrdiff_t>(offset);

  size_t line = 1 + static_cast<size_t>(std::count(begin, end, '\n'));
  size_t lastBreak = content.rfind('\n', offset == 0 ? 0 : offset - 1);
  size_t column =
      lastBreak == std::string::npos || lastBreak >= offset
          ? offset + 1
          : offset - lastBreak;
  return {line, column};
}

}  // namespace

nlohmann::json ConfigLoader::loadFromFile(const std::string& filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("ConfigLoader: Failed to open file " + filename);
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw std::runtime_error("ConfigLoader: Failed to read file " + filename);
  }
  return parse(content, filename);
}

nlohmann::json ConfigLoader::parse(const std::string& content,
                                   const std::string& origin) {
  nlohmann::json config;
  try {
    config = nlohmann::json::parse(content, nullptr, true, true);
  } catch (const nlohmann::json::parse_error& e) {
    // byte указывает на символ после ошибки
    auto [line, column] =
        lineAndColumn(content, e.byte == 0 ? 0 : e.byte - 1);
    std::ostringstream ss;
    ss << "ConfigLoader: JSON parse error in " << origin << " at line "
       << line << ", column " << column << " (byte " << e.byte
       << "): " << e.what();
    throw std::runtime_error(ss.str());
  }

  if (!config.is_object()) {
    throw std::runtime_error("ConfigLoader: " + origin +
                             ": top-level value must be an object, got " +
                             config.type_name());
  }
  return config;
}

}  // namespace lfs
