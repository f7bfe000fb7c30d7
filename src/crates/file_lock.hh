// SPDX-License-Identifier: MIT
#ifndef CRATES_FILE_LOCK_HH_
#define CRATES_FILE_LOCK_HH_

#include <filesystem>

#include "absl/status/statusor.h"
#include "absl/time/time.h"

namespace crates {

// An exclusive advisory lock on a file, held for the lifetime of the object.
// The lock guards against other processes, not other threads.
class FileLock {
 public:
  // Acquires the lock, creating the file if needed. With a zero timeout,
  // fails immediately if another process holds the lock. Otherwise polls
  // with exponential backoff until the timeout elapses.
  //
  // Returns DEADLINE_EXCEEDED if the lock could not be acquired in time, or
  // CANCELLED if an interrupt arrived while waiting.
  static absl::StatusOr<FileLock> Acquire(const std::filesystem::path& path,
                                          absl::Duration timeout);

  ~FileLock();

  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;

  FileLock(FileLock&& other) noexcept;
  FileLock& operator=(FileLock&& other) noexcept;

  const std::filesystem::path& path() const { return path_; }

 private:
  FileLock(int fd, std::filesystem::path path)
      : fd_(fd), path_(std::move(path)) {}

  void Release();

  int fd_ = -1;
  std::filesystem::path path_;
};

}  // namespace crates

#endif  // CRATES_FILE_LOCK_HH_
