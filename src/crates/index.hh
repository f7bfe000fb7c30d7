// SPDX-License-Identifier: MIT
#ifndef CRATES_INDEX_HH_
#define CRATES_INDEX_HH_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "crates/krate.hh"

namespace crates {

// A registry index. Implementations differ in where metadata comes from: a
// local git clone, the local cache of a sparse index, or the network.
class Index {
 public:
  enum class Kind : int8_t {
    GIT,
    SPARSE_CACHED,
    SPARSE_REMOTE,
  };

  // The outcome of looking up one crate: its metadata, std::nullopt if the
  // index has no such crate, or an error.
  using KrateResult = absl::StatusOr<std::optional<IndexKrate>>;
  using BatchResults = absl::flat_hash_map<std::string, KrateResult>;

  Index() = default;
  virtual ~Index() = default;

  Index(const Index&) = delete;
  Index& operator=(const Index&) = delete;

  Index(Index&&) = default;
  Index& operator=(Index&&) = default;

  virtual Kind kind() const = 0;

  // Brings the local copy of the index up to date over the network. Only git
  // indices keep a local copy which can be refreshed as a whole; for the
  // others this does nothing.
  virtual absl::Status Fetch() { return absl::OkStatus(); }

  // Synchronously looks up a single crate.
  virtual KrateResult Krate(std::string_view name) = 0;

  // Looks up many crates concurrently. Each crate is retried on transient
  // failures until per_item_timeout has elapsed, and succeeds or fails
  // independently of the others. A non-OK return means the batch could not
  // be issued at all.
  //
  // Only remote sparse indices implement this; the default implementation
  // returns UNIMPLEMENTED.
  virtual absl::StatusOr<BatchResults> KratesBatch(
      const std::vector<std::string>& names, absl::Duration per_item_timeout);
};

std::string_view KindToString(Index::Kind kind);

}  // namespace crates

#endif  // CRATES_INDEX_HH_
