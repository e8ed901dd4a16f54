#include "core/shell_util.h"

#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <string>

#include "absl/log/log.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"

#include <sys/wait.h>

namespace smartcmd {

namespace {

// Ignores a signal for the lifetime of the object and restores the previous disposition.
class ScopedIgnoreSignal {
 public:
  explicit ScopedIgnoreSignal(int sig) : sig_(sig) {
    struct sigaction ignore = {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    installed_ = sigaction(sig_, &ignore, &previous_) == 0;
  }
  ~ScopedIgnoreSignal() {
    if (installed_) sigaction(sig_, &previous_, nullptr);
  }

  ScopedIgnoreSignal(const ScopedIgnoreSignal&) = delete;
  ScopedIgnoreSignal& operator=(const ScopedIgnoreSignal&) = delete;

 private:
  int sig_;
  bool installed_ = false;
  struct sigaction previous_ = {};
};

}  // namespace

absl::StatusOr<int> RunInteractive(std::string_view command) {
  LOG(INFO) << "Running command: " << command;
  std::string cmd(command);

  ScopedIgnoreSignal ignore_int(SIGINT);
  ScopedIgnoreSignal ignore_quit(SIGQUIT);

  pid_t pid = fork();
  if (pid == -1) {
    return absl::ErrnoToStatus(errno, "Failed to fork");
  }

  if (pid == 0) {
    // Child process: restore default handling so Ctrl-C reaches the command.
    signal(SIGINT, SIG_DFL);
    signal(SIGQUIT, SIG_DFL);
    execl("/bin/sh", "sh", "-c", cmd.c_str(), nullptr);
    _exit(127);
  }

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      return absl::ErrnoToStatus(errno, absl::StrCat("waitpid failed for pid ", pid));
    }
  }

  int exit_code = -1;
  if (WIFEXITED(status)) {
    exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit_code = 128 + WTERMSIG(status);
  }
  LOG(INFO) << "Command exited with code " << exit_code;
  return exit_code;
}

std::string ExpandHome(std::string_view path) {
  if (path != "~" && !absl::StartsWith(path, "~/")) return std::string(path);
  const char* home = std::getenv("HOME");
  if (home == nullptr || home[0] == '\0') return std::string(path);
  return absl::StrCat(home, path.substr(1));
}

absl::Status ChangeDirectory(std::string_view target) {
  std::string dir = target.empty() ? ExpandHome("~") : ExpandHome(target);
  if (dir.empty() || dir == "~") {
    return absl::FailedPreconditionError("HOME is not set");
  }
  if (chdir(dir.c_str()) != 0) {
    return absl::ErrnoToStatus(errno, absl::StrCat("cd: ", dir));
  }
  return absl::OkStatus();
}

}  // namespace smartcmd
