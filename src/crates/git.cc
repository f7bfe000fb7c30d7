// SPDX-License-Identifier: MIT
#include "crates/git.hh"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

#include "absl/strings/str_cat.h"

namespace crates {

absl::StatusOr<GitResult> RunGit(const std::filesystem::path& git_dir,
                                 const std::vector<std::string>& args) {
  // Build the command line before forking; the child only execs.
  std::vector<std::string> argv = {"git",
                                   absl::StrCat("--git-dir=", git_dir.string())};
  argv.insert(argv.end(), args.begin(), args.end());

  std::vector<const char*> cmd;
  cmd.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    cmd.push_back(arg.c_str());
  }
  cmd.push_back(nullptr);

  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) {
    return absl::InternalError(
        absl::StrCat("failed to create pipe for git: ", strerror(errno)));
  }

  int pid = fork();
  if (pid < 0) {
    close(fds[0]);
    close(fds[1]);
    return absl::InternalError(
        absl::StrCat("failed to fork new process for git: ", strerror(errno)));
  }

  if (pid == 0) {
    if (dup2(fds[1], STDOUT_FILENO) < 0) {
      _exit(127);
    }

    execvp(cmd[0], const_cast<char* const*>(cmd.data()));
    _exit(127);
  }

  close(fds[1]);

  GitResult result;
  std::array<char, 8192> buf;
  while (true) {
    ssize_t n = read(fds[0], buf.data(), buf.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (n == 0) {
      break;
    }
    result.output.append(buf.data(), n);
  }
  close(fds[0]);

  int status;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return absl::InternalError(
          absl::StrCat("failed to wait for git: ", strerror(errno)));
    }
  }

  if (WIFSIGNALED(status)) {
    return absl::InternalError(
        absl::StrCat("git was killed by signal ", WTERMSIG(status)));
  }

  result.exit_status = WEXITSTATUS(status);
  if (result.exit_status == 127) {
    return absl::FailedPreconditionError("failed to execute git");
  }

  return result;
}

}  // namespace crates
