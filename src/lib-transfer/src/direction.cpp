/**
 * @file direction.cpp
 * @date October 2026
 * @brief Преобразование направления передачи в строку и обратно
 */

#include "lfs/direction.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace lfs {

std::string toString(Direction dir) {
  switch (dir) {
    case Direction::Upload:
      return "upload";
    case Direction::Download:
      return "download";
  }
  return "unknown";
}

Direction directionFromString(const std::string& value) {
  std::string lower(value);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "upload") return Direction::Upload;
  if (lower == "download") return Direction::Download;

  throw std::invalid_argument("Unknown transfer direction: " + value);
}

std::ostream& operator<<(std::ostream& os, Direction dir) {
  return os << toString(dir);
}

}  // namespace lfs
