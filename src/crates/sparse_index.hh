// SPDX-License-Identifier: MIT
#ifndef CRATES_SPARSE_INDEX_HH_
#define CRATES_SPARSE_INDEX_HH_

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "crates/cache_entry.hh"
#include "crates/client.hh"
#include "crates/index.hh"
#include "crates/location.hh"

namespace crates {

// The local cache of a sparse index. Nothing here touches the network.
class SparseIndex {
 public:
  explicit SparseIndex(IndexLocation location)
      : location_(std::move(location)) {}

  SparseIndex(const SparseIndex&) = default;
  SparseIndex& operator=(const SparseIndex&) = default;

  SparseIndex(SparseIndex&&) = default;
  SparseIndex& operator=(SparseIndex&&) = default;

  const IndexLocation& location() const { return location_; }

  std::filesystem::path CachePath(std::string_view name) const;

  // Reads a crate's cache entry. Returns std::nullopt if there is none, or if
  // it was written in a format we don't understand.
  absl::StatusOr<std::optional<CacheEntry>> ReadCacheEntry(
      std::string_view name) const;

  absl::StatusOr<std::optional<IndexKrate>> CachedKrate(
      std::string_view name) const;

  // Atomically replaces a crate's cache entry.
  absl::Status WriteCacheEntry(std::string_view name,
                               const CacheEntry& entry) const;

 private:
  IndexLocation location_;
};

// A sparse index which only answers from what is already cached locally.
class CachedSparseIndex : public Index {
 public:
  explicit CachedSparseIndex(SparseIndex index) : index_(std::move(index)) {}

  Kind kind() const override { return Kind::SPARSE_CACHED; }

  KrateResult Krate(std::string_view name) override {
    return index_.CachedKrate(name);
  }

 private:
  SparseIndex index_;
};

// A sparse index which fetches crates over HTTP and keeps the local cache up
// to date as it goes.
class RemoteSparseIndex : public Index {
 public:
  // Client options with an empty base URL are pointed at the index's own
  // location.
  RemoteSparseIndex(SparseIndex index, Client::Options options);

  Kind kind() const override { return Kind::SPARSE_REMOTE; }

  // Single lookups are served from the local cache; only batches go to the
  // network.
  KrateResult Krate(std::string_view name) override {
    return index_.CachedKrate(name);
  }

  // Creates an event loop for the duration of the call and fetches every
  // crate concurrently.
  absl::StatusOr<BatchResults> KratesBatch(
      const std::vector<std::string>& names,
      absl::Duration per_item_timeout) override;

  const Client::Options& options() const { return options_; }

 private:
  void QueueKrateRequest(Client& client, const std::string& name,
                         absl::Time deadline, int attempt,
                         BatchResults& results);

  KrateResult HandleResponse(const std::string& name,
                             absl::StatusOr<KrateResponse> response);

  SparseIndex index_;
  Client::Options options_;
};

// Whether a failed request is worth retrying.
bool IsTransientError(const absl::Status& status);

// How long to wait before the given retry of a request.
absl::Duration RetryBackoff(int attempt);

}  // namespace crates

#endif  // CRATES_SPARSE_INDEX_HH_
