// SPDX-License-Identifier: MIT
#ifndef YANKED_YANK_CACHE_HH_
#define YANKED_YANK_CACHE_HH_

#include <optional>
#include <string>
#include <string_view>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "crates/index.hh"

namespace yanked {

// Remembers, per crate name, which versions exist and whether each was
// yanked. Entries are never evicted and live as long as the cache.
class YankCache {
 public:
  // Version -> yanked.
  using VersionYankMap = absl::flat_hash_map<std::string, bool>;

  // The yank map of a crate, std::nullopt if the index has no such crate, or
  // the error which prevented finding out.
  using Entry = absl::StatusOr<std::optional<VersionYankMap>>;

  YankCache() = default;

  YankCache(const YankCache&) = delete;
  YankCache& operator=(const YankCache&) = delete;

  YankCache(YankCache&&) = default;
  YankCache& operator=(YankCache&&) = default;

  // Records the outcome of looking up a crate, replacing whatever was
  // recorded for it before.
  const Entry& Insert(std::string name, crates::Index::KrateResult result);

  // Returns nullptr if nothing was recorded for the crate.
  const Entry* Lookup(std::string_view name) const;

  bool Contains(std::string_view name) const {
    return entries_.contains(name);
  }

  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

 private:
  absl::flat_hash_map<std::string, Entry> entries_;
};

}  // namespace yanked

#endif  // YANKED_YANK_CACHE_HH_
