// SPDX-License-Identifier: MIT
#include "crates/file_lock.hh"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <system_error>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "crates/interrupt.hh"

namespace fs = std::filesystem;

namespace crates {

namespace {

constexpr absl::Duration kInitialBackoff = absl::Milliseconds(10);
constexpr absl::Duration kMaxBackoff = absl::Milliseconds(500);

}  // namespace

// static
absl::StatusOr<FileLock> FileLock::Acquire(const fs::path& path,
                                           absl::Duration timeout) {
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);

  int fd = open(path.c_str(), O_CREAT | O_CLOEXEC | O_RDWR, 0644);
  if (fd < 0) {
    return absl::InternalError(absl::StrCat(
        "failed to open lock file ", path.string(), ": ", strerror(errno)));
  }

  // Owns the descriptor from here on, so every early return closes it.
  FileLock lock(fd, path);

  const absl::Time deadline = absl::Now() + timeout;
  absl::Duration backoff = kInitialBackoff;
  bool warned = false;

  while (true) {
    if (IsInterrupted()) {
      return absl::CancelledError(
          absl::StrCat("interrupted while waiting for lock on ", path.string()));
    }

    if (flock(fd, LOCK_EX | LOCK_NB) == 0) {
      return lock;
    }

    if (errno == EINTR) {
      continue;
    }

    if (errno != EWOULDBLOCK) {
      return absl::InternalError(absl::StrCat(
          "failed to lock ", path.string(), ": ", strerror(errno)));
    }

    const absl::Duration remaining = deadline - absl::Now();
    if (remaining <= absl::ZeroDuration()) {
      return absl::DeadlineExceededError(
          absl::StrCat("timed out waiting for lock on ", path.string(),
                       " after ", absl::FormatDuration(timeout)));
    }

    if (!warned) {
      std::cerr << "warning: waiting for lock on " << path.string()
                << " (timeout: " << absl::FormatDuration(timeout) << ")\n";
      warned = true;
    }

    absl::SleepFor(std::min(backoff, remaining));
    backoff = std::min(backoff * 2, kMaxBackoff);
  }
}

FileLock::FileLock(FileLock&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)) {}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
  if (this != &other) {
    Release();
    fd_ = std::exchange(other.fd_, -1);
    path_ = std::move(other.path_);
  }
  return *this;
}

FileLock::~FileLock() { Release(); }

void FileLock::Release() {
  if (fd_ < 0) {
    return;
  }

  // Closing the last descriptor drops the lock, but be explicit about it.
  flock(fd_, LOCK_UN);
  close(fd_);
  fd_ = -1;
}

}  // namespace crates
