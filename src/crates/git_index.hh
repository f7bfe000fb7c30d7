// SPDX-License-Identifier: MIT
#ifndef CRATES_GIT_INDEX_HH_
#define CRATES_GIT_INDEX_HH_

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "crates/file_lock.hh"
#include "crates/index.hh"
#include "crates/location.hh"

namespace crates {

// An index kept as a git repository on the local disk, as cargo does for
// git registries. Lookups read files from the fetched commit without a
// checkout.
//
// The repository is guarded by a file lock shared with cargo. It is held for
// as long as the GitIndex exists.
class GitIndex : public Index {
 public:
  // Takes the lock, then opens the repository. A repository which doesn't
  // exist yet, or has never been fetched, is cloned.
  static absl::StatusOr<std::unique_ptr<GitIndex>> Open(
      IndexLocation location, absl::Duration lock_timeout);

  Kind kind() const override { return Kind::GIT; }

  absl::Status Fetch() override;

  KrateResult Krate(std::string_view name) override;

  // The commit which lookups read from.
  const std::string& head() const { return head_; }

  // Whether Open had to fetch because there was no commit yet. Such an
  // index is already as fresh as a Fetch would make it.
  bool fetched_on_open() const { return fetched_on_open_; }

 private:
  GitIndex(IndexLocation location, FileLock lock)
      : location_(std::move(location)), lock_(std::move(lock)) {}

  std::filesystem::path git_dir() const { return location_.path() / ".git"; }

  absl::Status Init();
  absl::Status ResolveHead();

  IndexLocation location_;
  FileLock lock_;
  std::string head_;
  bool fetched_on_open_ = false;
};

}  // namespace crates

#endif  // CRATES_GIT_INDEX_HH_
