/**
 * @file transfercontroller.hpp
 * @date October 2026
 * @brief Точка управления утилитой lfs-transfer
 *
 * @details
 * TransferController разбирает аргументы, настраивает логирование,
 * загружает конфигурацию, строит реестр адаптеров и выполняет подкоманду.
 *
 * Коды возврата:
 *  - 0: успех;
 *  - 1: ошибка выполнения (конфликт атрибутов, сбой git, плохой файл
 *       конфигурации);
 *  - 2: ошибка в аргументах командной строки.
 */

#pragma once

#include <iostream>
#include <memory>
#include <ostream>

#include "../include/argumentparser.hpp"
#include "lfs/environment.hpp"
#include "lfs/gitconfiguration.hpp"
#include "lfs/manifest.hpp"

class TransferController {
 public:
  static constexpr int kExitSuccess = 0;
  static constexpr int kExitFailure = 1;
  static constexpr int kExitUsage = 2;

  /**
     * @param out  Поток для результатов команд
     * @param err  Поток для сообщений об ошибках
     * @param git  Доступ к git config. Если не задан, используется
     *             GitCommandConfiguration.
     */
  explicit TransferController(
      std::ostream& out = std::cout, std::ostream& err = std::cerr,
      std::unique_ptr<lfs::GitConfiguration> git = nullptr);

  /**
     * @code
     * int main(int argc, char** argv) {
     *   TransferController controller;
     *   return controller.run(argc, argv);
     * }
     * @endcode
     */
  int run(int argc, char** argv);

 private:
  void initLogger(const ParsedArgs& args);
  std::unique_ptr<lfs::Environment> loadEnvironment(const ParsedArgs& args);
  void buildManifest(const lfs::Environment& env);

  void listAdapters(const ParsedArgs& args);
  void resolveAdapter(const ParsedArgs& args);
  void installFilter(const ParsedArgs& args, bool uninstall);

  std::ostream& out_;
  std::ostream& err_;
  std::unique_ptr<lfs::GitConfiguration> git_;
  lfs::Manifest manifest_;
};
