/**
 * @file selfpath.cpp
 * @date October 2026
 * @brief Путь к исполняемому файлу процесса
 */

#include "lfs/selfpath.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace lfs {

namespace {

std::string readSelfPath() {
  std::error_code ec;
  std::filesystem::path path = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec) {
    throw std::runtime_error(
        "error getting the path to the executable: " + ec.message());
  }
  return path.string();
}

}  // namespace

const std::string& selfPath() {
  static const std::string path = readSelfPath();
  return path;
}

}  // namespace lfs
