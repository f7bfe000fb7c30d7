// SPDX-License-Identifier: MIT
#ifndef CRATES_CACHE_ENTRY_HH_
#define CRATES_CACHE_ENTRY_HH_

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "crates/krate.hh"

namespace crates {

// A crate's file in the local cache of an index, in the layout cargo uses:
//
//   u8     cache version
//   u32le  index format version
//   revision '\0'
//   (version '\0' json '\0')*
//
// The revision records what the server told us about the copy we have, so
// that later requests can be made conditional.
struct CacheEntry {
  static constexpr uint8_t kCacheVersion = 3;
  static constexpr uint32_t kIndexVersion = 2;

  static constexpr std::string_view kEtagPrefix = "etag: ";
  static constexpr std::string_view kLastModifiedPrefix = "last-modified: ";

  // Decodes a cache file. Files written with a different cache or index
  // format version are reported as FAILED_PRECONDITION.
  static absl::StatusOr<CacheEntry> Parse(std::string_view bytes);

  // Builds an entry from the contents of an index file.
  static absl::StatusOr<CacheEntry> FromIndexFile(std::string revision,
                                                  std::string_view bytes);

  CacheEntry() = default;

  CacheEntry(const CacheEntry&) = default;
  CacheEntry& operator=(const CacheEntry&) = default;

  CacheEntry(CacheEntry&&) = default;
  CacheEntry& operator=(CacheEntry&&) = default;

  std::string Serialize() const;

  absl::StatusOr<IndexKrate> ToKrate() const;

  // The ETag or Last-Modified value the entry was stored with, or an empty
  // string if the revision is of another kind.
  std::string_view etag() const;
  std::string_view last_modified() const;

  std::string revision;

  // Pairs of (version, index line).
  std::vector<std::pair<std::string, std::string>> versions;
};

}  // namespace crates

#endif  // CRATES_CACHE_ENTRY_HH_
