// SPDX-License-Identifier: MIT
#ifndef YANKED_CACHED_INDEX_HH_
#define YANKED_CACHED_INDEX_HH_

#include <memory>
#include <optional>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "crates/client.hh"
#include "crates/index.hh"
#include "crates/location.hh"
#include "yanked/package.hh"
#include "yanked/yank_cache.hh"

namespace yanked {

// Answers whether packages were yanked from the crates.io index, looking up
// each crate at most once for the lifetime of the object.
//
// Not thread-safe.
class CachedIndex {
 public:
  // How long each crate of a batch may take, including retries.
  static constexpr absl::Duration kRequestTimeout = absl::Seconds(10);

  // Opens the index and brings it up to date over the network. For a git
  // index this fetches the repository while holding its lock. For a sparse
  // index, crates are fetched on demand with the given client options, forced
  // onto HTTP/2.
  //
  // A lock_timeout of zero fails immediately if another process holds the
  // lock.
  static absl::StatusOr<CachedIndex> Fetch(
      std::optional<crates::Client::Options> client_options,
      absl::Duration lock_timeout);
  static absl::StatusOr<CachedIndex> Fetch(
      crates::IndexLocation location,
      std::optional<crates::Client::Options> client_options,
      absl::Duration lock_timeout);

  // Opens the index without touching the network. Sparse lookups are only
  // answered from the local cache.
  static absl::StatusOr<CachedIndex> Open(absl::Duration lock_timeout);
  static absl::StatusOr<CachedIndex> Open(crates::IndexLocation location,
                                          absl::Duration lock_timeout);

  explicit CachedIndex(std::unique_ptr<crates::Index> index)
      : index_(std::move(index)) {}

  CachedIndex(const CachedIndex&) = delete;
  CachedIndex& operator=(const CachedIndex&) = delete;

  CachedIndex(CachedIndex&&) = default;
  CachedIndex& operator=(CachedIndex&&) = default;

  // Returns the yanked packages among the given ones, and an error for every
  // package whose crate or version doesn't exist or couldn't be looked up.
  // Packages which exist and weren't yanked are left out. Duplicates are
  // reported once.
  //
  // If the index couldn't be queried at all, a single error saying so comes
  // first, followed by whatever could still be answered. The rest is ordered
  // by package. Returned pointers refer into the given packages.
  std::vector<absl::StatusOr<const Package*>> FindYanked(
      absl::Span<const Package> packages);

  // Whether a single package was yanked, looking up its crate if it isn't
  // cached yet. Returns NOT_FOUND if the crate or version doesn't exist.
  absl::StatusOr<bool> IsYanked(const Package& package);

  crates::Index::Kind kind() const { return index_->kind(); }

  const YankCache& cache() const { return cache_; }

 private:
  // Looks up every name not yet in the cache. Returns an error only if the
  // index couldn't be queried at all; failures of individual crates are
  // stored in the cache.
  absl::Status PopulateCache(const std::vector<std::string>& names);

  std::unique_ptr<crates::Index> index_;
  YankCache cache_;
};

}  // namespace yanked

#endif  // YANKED_CACHED_INDEX_HH_
