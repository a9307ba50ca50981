/**
 * @file gitconfiguration.cpp
 * @date October 2026
 * @brief Запуск git config в дочернем процессе
 */

#include "lfs/gitconfiguration.hpp"

#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

#include "lfs/compositelogger.hpp"

namespace lfs {

namespace {

// Ключ "не найден" у git config --get и --get-regexp
constexpr int kGitKeyNotFound = 1;

std::string escapeRegex(const std::string& text) {
  static const std::string special = R"(\^$.|?*+()[]{})";
  std::string escaped;
  for (char c : text) {
    if (special.find(c) != std::string::npos) escaped += '\\';
    escaped += c;
  }
  return escaped;
}

std::string joinArgs(const std::vector<std::string>& args) {
  std::string joined;
  for (const auto& arg : args) {
    if (!joined.empty()) joined += ' ';
    joined += arg;
  }
  return joined;
}

void closeFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

}  // namespace

std::string scopeFlag(ConfigScope scope) {
  switch (scope) {
    case ConfigScope::Local:
      return "--local";
    case ConfigScope::Worktree:
      return "--worktree";
    case ConfigScope::System:
      return "--system";
    case ConfigScope::Global:
      return "--global";
  }
  return "--global";
}

GitCommandConfiguration::GitCommandConfiguration(std::string gitBinary)
    : gitBinary_(std::move(gitBinary)) {}

std::string GitCommandConfiguration::find(ConfigScope scope,
                                          const std::string& key) {
  const std::vector<std::string> args = {"config", scopeFlag(scope), "--get",
                                         key};
  CommandResult result = run(args);

  if (result.status == kGitKeyNotFound) {
    return {};
  }
  if (result.status != 0) {
    fail(args, result);
  }

  while (!result.out.empty() &&
         (result.out.back() == '\n' || result.out.back() == '\r')) {
    result.out.pop_back();
  }
  return result.out;
}

void GitCommandConfiguration::set(ConfigScope scope, const std::string& key,
                                  const std::string& value) {
  const std::vector<std::string> args = {"config", scopeFlag(scope), key,
                                         value};
  CommandResult result = run(args);
  if (result.status != 0) {
    fail(args, result);
  }
  CompositeLogger::instance().debug("git config " + scopeFlag(scope) + " " +
                                    key + " = " + value);
}

void GitCommandConfiguration::unsetSection(ConfigScope scope,
                                           const std::string& section) {
  const std::vector<std::string> lookupArgs = {
      "config", scopeFlag(scope), "--get-regexp",
      "^" + escapeRegex(section) + "\\."};
  CommandResult existing = run(lookupArgs);

  if (existing.status == kGitKeyNotFound) {
    CompositeLogger::instance().debug("git config " + scopeFlag(scope) +
                                      ": section " + section +
                                      " is not set, nothing to remove");
    return;
  }
  if (existing.status != 0) {
    fail(lookupArgs, existing);
  }

  const std::vector<std::string> args = {"config", scopeFlag(scope),
                                         "--remove-section", section};
  CommandResult result = run(args);
  if (result.status != 0) {
    fail(args, result);
  }
  CompositeLogger::instance().debug("git config " + scopeFlag(scope) +
                                    ": removed section " + section);
}

GitCommandConfiguration::CommandResult GitCommandConfiguration::run(
    const std::vector<std::string>& args) {
  int outPipe[2] = {-1, -1};
  int errPipe[2] = {-1, -1};

  if (::pipe(outPipe) < 0) {
    throw std::system_error(errno, std::system_category(),
                            "GitCommandConfiguration: pipe failed");
  }
  if (::pipe(errPipe) < 0) {
    int savedErrno = errno;
    closeFd(outPipe[0]);
    closeFd(outPipe[1]);
    throw std::system_error(savedErrno, std::system_category(),
                            "GitCommandConfiguration: pipe failed");
  }

  std::vector<char*> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char*>(gitBinary_.c_str()));
  for (const auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    int savedErrno = errno;
    closeFd(outPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[0]);
    closeFd(errPipe[1]);
    throw std::system_error(savedErrno, std::system_category(),
                            "GitCommandConfiguration: fork failed");
  }

  if (pid == 0) {
    ::dup2(outPipe[1], STDOUT_FILENO);
    ::dup2(errPipe[1], STDERR_FILENO);
    ::close(outPipe[0]);
    ::close(outPipe[1]);
    ::close(errPipe[0]);
    ::close(errPipe[1]);

    ::execvp(argv[0], argv.data());

    const char* reason = std::strerror(errno);
    ssize_t ignored = ::write(STDERR_FILENO, reason, std::strlen(reason));
    (void)ignored;
    ::_exit(127);
  }

  closeFd(outPipe[1]);
  closeFd(errPipe[1]);

  CommandResult result;
  std::array<pollfd, 2> fds = {{{outPipe[0], POLLIN, 0},
                                {errPipe[0], POLLIN, 0}}};
  std::array<std::string*, 2> sinks = {&result.out, &result.err};
  int openFds = 2;
  char buffer[4096];

  while (openFds > 0) {
    if (::poll(fds.data(), fds.size(), -1) < 0) {
      if (errno == EINTR) continue;
      break;
    }
    for (size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) continue;
      ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
      if (n > 0) {
        sinks[i]->append(buffer, static_cast<size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        ::close(fds[i].fd);
        fds[i].fd = -1;
        --openFds;
      }
    }
  }
  for (auto& fd : fds) {
    if (fd.fd >= 0) ::close(fd.fd);
  }

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw std::system_error(errno, std::system_category(),
                              "GitCommandConfiguration: waitpid failed");
    }
  }

  if (WIFEXITED(status)) {
    result.status = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.status = 128 + WTERMSIG(status);
  } else {
    result.status = -1;
  }
  return result;
}

void GitCommandConfiguration::fail(const std::vector<std::string>& args,
                                   const CommandResult& result) const {
  std::string message = "GitCommandConfiguration: '" + gitBinary_ + " " +
                        joinArgs(args) + "' exited with status " +
                        std::to_string(result.status);
  std::string err = result.err;
  while (!err.empty() && (err.back() == '\n' || err.back() == '\r')) {
    err.pop_back();
  }
  if (!err.empty()) {
    message += ": " + err;
  }
  throw GitConfigError(message, result.status);
}

}  // namespace lfs
