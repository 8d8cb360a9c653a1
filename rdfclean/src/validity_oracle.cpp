#include "validity_oracle.hpp"
#include "text_processor.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

extern char **environ;

namespace RdfClean {
namespace oracle {

namespace {

constexpr size_t kMaxDiagnosticsBytes = 4096;
constexpr int kPollIntervalMs = 50;

// Reads whatever is available without blocking. Returns false at EOF.
bool drainPipe(int fd, std::string &out) {
  char buf[4096];
  while (true) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      if (out.size() < kMaxDiagnosticsBytes) {
        size_t room = kMaxDiagnosticsBytes - out.size();
        out.append(buf, std::min(static_cast<size_t>(n), room));
      }
      continue;
    }
    if (n < 0 && errno == EINTR)
      continue;
    return n < 0; // EAGAIN: still open
  }
}

class SpawnFileActions {
public:
  SpawnFileActions() { posix_spawn_file_actions_init(&actions_); }
  ~SpawnFileActions() { posix_spawn_file_actions_destroy(&actions_); }

  SpawnFileActions(const SpawnFileActions &) = delete;
  SpawnFileActions &operator=(const SpawnFileActions &) = delete;

  posix_spawn_file_actions_t *get() { return &actions_; }

private:
  posix_spawn_file_actions_t actions_;
};

std::string secondsText(std::chrono::milliseconds timeout) {
  long long ms = timeout.count();
  if (ms % 1000 == 0)
    return std::to_string(ms / 1000) + "s";
  return std::to_string(ms) + "ms";
}

} // namespace

const char *toString(OracleStatus status) {
  switch (status) {
  case OracleStatus::Valid:
    return "valid";
  case OracleStatus::Invalid:
    return "invalid";
  case OracleStatus::Unavailable:
    return "unavailable";
  }
  return "unavailable";
}

CommandOracle::CommandOracle(OracleConfig config, const log::Logger &logger)
    : config_(std::move(config)), logger_(logger) {}

std::vector<std::string>
CommandOracle::buildArgv(const std::string &path) const {
  std::vector<std::string> argv;
  argv.reserve(config_.args.size() + 2);
  argv.push_back(config_.command);
  argv.insert(argv.end(), config_.args.begin(), config_.args.end());
  argv.push_back(path);
  return argv;
}

OracleStatus CommandOracle::check(const std::string &path) {
  diagnostics_.clear();

  std::vector<std::string> argv = buildArgv(path);
  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (auto &arg : argv)
    cargv.push_back(const_cast<char *>(arg.c_str()));
  cargv.push_back(nullptr);

  if (log::Logger::isDebugEnabled()) {
    std::string cmdline;
    for (const auto &arg : argv) {
      if (!cmdline.empty())
        cmdline += ' ';
      cmdline += arg;
    }
    logger_.debug("Oracle command: " + cmdline);
  }

  int fds[2];
  if (::pipe(fds) != 0) {
    logger_.error("Cannot create pipe for " + config_.command + ": " +
                  std::strerror(errno));
    return OracleStatus::Unavailable;
  }
  ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
  ::fcntl(fds[0], F_SETFL, O_NONBLOCK);

  pid_t pid = 0;
  int spawnRc = 0;
  {
    SpawnFileActions actions;
    posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null",
                                     O_RDONLY, 0);
    posix_spawn_file_actions_addopen(actions.get(), STDOUT_FILENO,
                                     "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_adddup2(actions.get(), fds[1], STDERR_FILENO);
    spawnRc = ::posix_spawnp(&pid, cargv[0], actions.get(), nullptr,
                             cargv.data(), environ);
  }
  ::close(fds[1]);

  if (spawnRc != 0) {
    ::close(fds[0]);
    if (spawnRc == ENOENT) {
      logger_.error(config_.command +
                    " not found. Install raptor2-utils to enable validation.");
    } else {
      logger_.error("Cannot start " + config_.command + ": " +
                    std::strerror(spawnRc));
    }
    return OracleStatus::Unavailable;
  }

  const auto start = std::chrono::steady_clock::now();
  bool pipeOpen = true;
  bool exited = false;
  int status = 0;
  while (true) {
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      exited = true;
      break;
    }
    if (r < 0) {
      if (errno == EINTR)
        continue;
      logger_.error("waitpid failed for " + config_.command + ": " +
                    std::strerror(errno));
      break;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    if (elapsed >= config_.timeout) {
      ::kill(pid, SIGKILL);
      while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
      }
      ::close(fds[0]);
      logger_.warning(config_.command + " timed out after " +
                      secondsText(config_.timeout) + ": " + path);
      return OracleStatus::Unavailable;
    }

    int waitMs = static_cast<int>(std::min<long long>(
        kPollIntervalMs, (config_.timeout - elapsed).count()));
    if (pipeOpen) {
      pollfd pfd{fds[0], POLLIN, 0};
      if (::poll(&pfd, 1, waitMs) > 0) {
        pipeOpen = drainPipe(fds[0], diagnostics_);
      }
    } else {
      ::usleep(static_cast<useconds_t>(std::max(waitMs, 1)) * 1000);
    }
  }

  if (pipeOpen) {
    drainPipe(fds[0], diagnostics_);
  }
  ::close(fds[0]);

  if (!exited) {
    return OracleStatus::Unavailable;
  }

  if (WIFEXITED(status)) {
    int rc = WEXITSTATUS(status);
    if (rc == 0) {
      logger_.info("Validation successful: " + path);
      return OracleStatus::Valid;
    }
    if (rc == 127) {
      // Shell-style "command not found" from the child
      logger_.error(config_.command + " could not be executed");
      return OracleStatus::Unavailable;
    }
    logger_.warning("Validation FAILED: " + path);
  } else if (WIFSIGNALED(status)) {
    logger_.warning("Validation FAILED: " + path + " (" + config_.command +
                    " killed by signal " + std::to_string(WTERMSIG(status)) +
                    ")");
  }

  std::string diag = text::TextProcessor::trim(diagnostics_);
  if (!diag.empty()) {
    logger_.warning(config_.command + " stderr: " + diag);
  }
  return OracleStatus::Invalid;
}

} // namespace oracle
} // namespace RdfClean
