// SPDX-License-Identifier: MIT
#include "crates/git_index.hh"

#include <system_error>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "crates/git.hh"
#include "crates/interrupt.hh"

namespace fs = std::filesystem;

namespace crates {

namespace {

// Where a fetch leaves the index, in order of preference. Repositories set up
// by other tools may only have one of the later ones.
constexpr std::string_view kHeadRefs[] = {
    "refs/remotes/origin/HEAD",
    "FETCH_HEAD",
    "HEAD",
};

}  // namespace

// static
absl::StatusOr<std::unique_ptr<GitIndex>> GitIndex::Open(
    IndexLocation location, absl::Duration lock_timeout) {
  auto lock = FileLock::Acquire(location.lock_path(), lock_timeout);
  if (!lock.ok()) {
    return lock.status();
  }

  std::unique_ptr<GitIndex> index(
      new GitIndex(std::move(location), *std::move(lock)));

  std::error_code ec;
  if (!fs::exists(index->git_dir(), ec)) {
    if (auto status = index->Init(); !status.ok()) {
      return status;
    }
  }

  if (!index->ResolveHead().ok()) {
    if (auto status = index->Fetch(); !status.ok()) {
      return status;
    }
    index->fetched_on_open_ = true;
  }

  return index;
}

absl::Status GitIndex::Init() {
  std::error_code ec;
  fs::create_directories(location_.path(), ec);
  if (ec) {
    return absl::InternalError(absl::StrCat(
        "failed to create ", location_.path().string(), ": ", ec.message()));
  }

  auto result = RunGit(git_dir(), {"init", "--quiet", "--bare"});
  if (!result.ok()) {
    return result.status();
  }

  if (result->exit_status != 0) {
    return absl::InternalError(
        absl::StrCat("git init of ", git_dir().string(),
                     " failed with exit status ", result->exit_status));
  }

  return absl::OkStatus();
}

absl::Status GitIndex::ResolveHead() {
  for (const auto ref : kHeadRefs) {
    auto result = RunGit(
        git_dir(),
        {"rev-parse", "--verify", "--quiet", absl::StrCat(ref, "^{commit}")});
    if (!result.ok()) {
      return result.status();
    }

    if (result->exit_status == 0) {
      head_ = std::string(absl::StripAsciiWhitespace(result->output));
      return absl::OkStatus();
    }
  }

  return absl::FailedPreconditionError(absl::StrCat(
      "index repository ", git_dir().string(), " has no fetched commit"));
}

absl::Status GitIndex::Fetch() {
  if (IsInterrupted()) {
    return absl::CancelledError("interrupted");
  }

  auto result = RunGit(git_dir(), {"fetch", "--quiet", "--force",
                                   location_.url(),
                                   "+HEAD:refs/remotes/origin/HEAD"});
  if (!result.ok()) {
    return result.status();
  }

  if (result->exit_status != 0) {
    return absl::UnavailableError(
        absl::StrCat("git fetch from ", location_.url(),
                     " failed with exit status ", result->exit_status));
  }

  return ResolveHead();
}

Index::KrateResult GitIndex::Krate(std::string_view name) {
  if (auto status = ValidateCrateName(name); !status.ok()) {
    return status;
  }

  if (IsInterrupted()) {
    return absl::CancelledError("interrupted");
  }

  const std::string object = absl::StrCat(head_, ":", CratePath(name));

  // With --quiet, rev-parse exits 1 for an object which doesn't exist, and
  // 128 for anything worse.
  auto exists = RunGit(git_dir(), {"rev-parse", "--verify", "--quiet", object});
  if (!exists.ok()) {
    return exists.status();
  }

  if (exists->exit_status == 1) {
    return std::nullopt;
  }

  if (exists->exit_status != 0) {
    return absl::InternalError(absl::StrCat(
        "failed to look up ", object, " in ", git_dir().string()));
  }

  auto blob = RunGit(git_dir(), {"cat-file", "blob", object});
  if (!blob.ok()) {
    return blob.status();
  }

  if (blob->exit_status != 0) {
    return absl::InternalError(
        absl::StrCat("failed to read ", object, " from ", git_dir().string()));
  }

  auto krate = IndexKrate::Parse(blob->output);
  if (!krate.ok()) {
    return krate.status();
  }

  return *std::move(krate);
}

}  // namespace crates
