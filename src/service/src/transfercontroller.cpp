/**
 * @file transfercontroller.cpp
 * @date October 2026
 * @brief Выполнение подкоманд lfs-transfer и коды возврата
 */

#include "../include/transfercontroller.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "lfs/attribute.hpp"
#include "lfs/compositelogger.hpp"
#include "lfs/consolelogger.hpp"
#include "lfs/jsonenvironment.hpp"
#include "lfs/manifestconfig.hpp"

namespace {

// Сообщения уровнем ниже warning в консоль не выводятся, если не задано иное
constexpr lfs::LogLevel kDefaultLogLevel = lfs::LogLevel::LOG_WARNING;

void printNames(std::ostream& out, std::vector<std::string> names,
                const std::string& prefix) {
  std::sort(names.begin(), names.end());
  for (const auto& name : names) {
    out << prefix << name << '\n';
  }
}

}  // namespace

TransferController::TransferController(
    std::ostream& out, std::ostream& err,
    std::unique_ptr<lfs::GitConfiguration> git)
    : out_(out), err_(err), git_(std::move(git)) {}

int TransferController::run(int argc, char** argv) {
  ParsedArgs args;
  try {
    ArgumentParser parser;
    args = parser.parse(argc, argv);
  } catch (const std::invalid_argument& e) {
    err_ << e.what() << "\n\n" << ArgumentParser::usage();
    return kExitUsage;
  }

  if (args.help) {
    out_ << ArgumentParser::usage();
    return kExitSuccess;
  }

  try {
    initLogger(args);
    std::unique_ptr<lfs::Environment> env = loadEnvironment(args);
    buildManifest(*env);

    switch (args.command) {
      case Command::Adapters:
        listAdapters(args);
        break;
      case Command::Resolve:
        resolveAdapter(args);
        break;
      case Command::Install:
        installFilter(args, false);
        break;
      case Command::Uninstall:
        installFilter(args, true);
        break;
      case Command::None:
        break;
    }
    out_.flush();
    return kExitSuccess;
  } catch (const std::invalid_argument& e) {
    lfs::CompositeLogger::instance().error(e.what());
    err_ << e.what() << '\n';
    return kExitUsage;
  } catch (const std::exception& e) {
    lfs::CompositeLogger::instance().critical(e.what());
    err_ << e.what() << '\n';
    return kExitFailure;
  }
}

void TransferController::initLogger(const ParsedArgs& args) {
  auto& compositeLogger = lfs::CompositeLogger::instance();

  // shared_ptr без удаления для синглтона
  auto getSingletonPtr = [](auto& singleton) {
    return std::shared_ptr<std::remove_reference_t<decltype(singleton)>>(
        &singleton, [](auto*) {});
  };

  static const std::shared_ptr<lfs::ILogger> console =
      getSingletonPtr(lfs::ConsoleLogger::instance());

  lfs::LogLevel level = args.log_level
                            ? lfs::levelFromString(*args.log_level)
                            : kDefaultLogLevel;
  lfs::ConsoleLogger::instance().init(level);

  compositeLogger.removeLogger(console);
  compositeLogger.addLogger(console);
}

std::unique_ptr<lfs::Environment> TransferController::loadEnvironment(
    const ParsedArgs& args) {
  if (!args.config_path) {
    return std::make_unique<lfs::MapEnvironment>();
  }
  return std::make_unique<lfs::JsonEnvironment>(
      lfs::JsonEnvironment::fromFile(*args.config_path));
}

void TransferController::buildManifest(const lfs::Environment& env) {
  lfs::configureManifest(manifest_, env);
  manifest_.initCustomAdapters(env);
}

void TransferController::listAdapters(const ParsedArgs& args) {
  if (args.direction) {
    printNames(out_, manifest_.getAdapterNames(*args.direction), "");
    return;
  }
  printNames(out_, manifest_.getUploadAdapterNames(), "upload: ");
  printNames(out_, manifest_.getDownloadAdapterNames(), "download: ");
}

void TransferController::resolveAdapter(const ParsedArgs& args) {
  const lfs::Direction dir = args.direction.value_or(lfs::Direction::Download);

  std::unique_ptr<lfs::TransferAdapter> adapter =
      manifest_.newAdapterOrDefault(args.adapter_name, dir);
  if (!adapter) {
    throw std::runtime_error("No transfer adapter available for \"" +
                             args.adapter_name + "\"");
  }

  lfs::AdapterConfig config;
  config.concurrentTransfers = manifest_.concurrentTransfers();
  adapter->begin(config);
  out_ << lfs::toString(adapter->direction()) << ' ' << adapter->name()
       << " concurrency=" << adapter->concurrency() << '\n';
  adapter->end();
}

void TransferController::installFilter(const ParsedArgs& args,
                                       bool uninstall) {
  if (!git_) {
    git_ = std::make_unique<lfs::GitCommandConfiguration>();
  }

  lfs::FilterOptions options;
  options.gitConfig = git_.get();
  options.force = args.force;
  options.local = args.local;
  options.worktree = args.worktree;
  options.system = args.system;
  options.skipSmudge = args.skip_smudge;

  if (uninstall) {
    options.uninstall();
    out_ << "Git LFS filter uninstalled (" << lfs::scopeFlag(options.scope())
         << ")\n";
  } else {
    options.install();
    out_ << "Git LFS filter installed (" << lfs::scopeFlag(options.scope())
         << ")\n";
  }
}
