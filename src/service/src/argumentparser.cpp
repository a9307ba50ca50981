/**
 * @file argumentparser.cpp
 * @date October 2026
 * @brief Разбор аргументов командной строки lfs-transfer
 */

#include "../include/argumentparser.hpp"

#include <algorithm>
#include <cctype>

using namespace std;

namespace {

// "--name" или "--name=value"
bool matches(const string& arg, const string& name) {
  return arg == name || arg.compare(0, name.size() + 1, name + "=") == 0;
}

Command commandFromString(const string& name) {
  if (name == "adapters") return Command::Adapters;
  if (name == "resolve") return Command::Resolve;
  if (name == "install") return Command::Install;
  if (name == "uninstall") return Command::Uninstall;
  throw invalid_argument("ArgumentParser: Unknown command: " + name);
}

}  // namespace

const vector<string> ArgumentParser::validLogLevels = {
    "debug", "info", "warning", "warn", "error", "critical"};

ParsedArgs ArgumentParser::parse(int argc, char** argv) {
  ParsedArgs args;

  for (int i = 1; i < argc; ++i) {
    string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
    } else if (matches(arg, "--log-level")) {
      parseLogLevel(arg, args, i, argc, argv);
    } else if (matches(arg, "--config-file")) {
      args.config_path = takeValue(arg, "--config-file", i, argc, argv);
    } else if (args.command == Command::None) {
      if (!arg.empty() && arg.front() == '-') {
        throw invalid_argument("ArgumentParser: Unknown argument: " + arg);
      }
      args.command = commandFromString(arg);
    } else {
      parseCommandOption(arg, args, i, argc, argv);
    }
  }

  validate(args);
  return args;
}

string ArgumentParser::takeValue(const string& arg, const string& name,
                                 int& i, int argc, char** argv) const {
  size_t eqPos = arg.find('=');
  string value;

  if (eqPos != string::npos) {
    value = arg.substr(eqPos + 1);
  } else if (i + 1 < argc) {
    value = argv[++i];
  } else {
    throw invalid_argument("ArgumentParser: " + name + " requires a value");
  }

  if (value.empty()) {
    throw invalid_argument("ArgumentParser: " + name + " requires a value");
  }
  return value;
}

void ArgumentParser::parseLogLevel(const string& arg, ParsedArgs& args,
                                   int& i, int argc, char** argv) {
  string value = takeValue(arg, "--log-level", i, argc, argv);
  string lower(value);
  transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return tolower(c); });

  if (find(validLogLevels.begin(), validLogLevels.end(), lower) ==
      validLogLevels.end()) {
    throw invalid_argument("ArgumentParser: Invalid log level: " + value);
  }
  args.log_level = lower;
}

void ArgumentParser::parseDirection(const string& arg, ParsedArgs& args,
                                    int& i, int argc, char** argv) {
  string value = takeValue(arg, "--direction", i, argc, argv);
  try {
    args.direction = lfs::directionFromString(value);
  } catch (const invalid_argument&) {
    throw invalid_argument("ArgumentParser: Invalid direction: " + value +
                           " (expected upload or download)");
  }
}

void ArgumentParser::parseCommandOption(const string& arg, ParsedArgs& args,
                                        int& i, int argc, char** argv) {
  const Command cmd = args.command;
  const bool listing = cmd == Command::Adapters || cmd == Command::Resolve;
  const bool installing = cmd == Command::Install || cmd == Command::Uninstall;

  if (listing && matches(arg, "--direction")) {
    parseDirection(arg, args, i, argc, argv);
  } else if (cmd == Command::Install && arg == "--force") {
    args.force = true;
  } else if (cmd == Command::Install && arg == "--skip-smudge") {
    args.skip_smudge = true;
  } else if (installing && arg == "--local") {
    args.local = true;
  } else if (installing && arg == "--worktree") {
    args.worktree = true;
  } else if (installing && arg == "--system") {
    args.system = true;
  } else if (cmd == Command::Resolve && args.adapter_name.empty() &&
             !arg.empty() && arg.front() != '-') {
    args.adapter_name = arg;
  } else {
    throw invalid_argument("ArgumentParser: Unknown argument: " + arg);
  }
}

void ArgumentParser::validate(const ParsedArgs& args) const {
  if (args.help) {
    return;
  }
  if (args.command == Command::None) {
    throw invalid_argument("ArgumentParser: No command given");
  }
  if (args.command == Command::Resolve && args.adapter_name.empty()) {
    throw invalid_argument("ArgumentParser: resolve requires an adapter name");
  }

  int scopes = static_cast<int>(args.local) + static_cast<int>(args.worktree) +
               static_cast<int>(args.system);
  if (scopes > 1) {
    throw invalid_argument(
        "ArgumentParser: Only one of --local, --worktree, --system may be "
        "given");
  }
}

string ArgumentParser::usage() {
  return "Usage: lfs-transfer [--log-level LEVEL] [--config-file FILE] "
         "<command> [options]\n"
         "\n"
         "Commands:\n"
         "  adapters [--direction upload|download]\n"
         "      List registered transfer adapter names\n"
         "  resolve <name> [--direction upload|download]\n"
         "      Show the adapter that would be used for <name>\n"
         "  install [--force] [--local|--worktree|--system] [--skip-smudge]\n"
         "      Install the filter.lfs section into git config\n"
         "  uninstall [--local|--worktree|--system]\n"
         "      Remove the filter.lfs section from git config\n"
         "\n"
         "Options:\n"
         "  --log-level LEVEL   debug, info, warning, error, critical "
         "(default: warning)\n"
         "  --config-file FILE  JSON configuration with lfs.* keys\n"
         "  -h, --help          Show this help\n";
}
