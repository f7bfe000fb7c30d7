// SPDX-License-Identifier: MIT
#ifndef CRATES_KRATE_HH_
#define CRATES_KRATE_HH_

#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"

namespace crates {

// A single published version of a crate, described by one line of the
// crate's index file. The version string is kept verbatim: the index holds
// entries which are not valid semver.
struct IndexVersion {
  IndexVersion() = default;

  std::string name;
  std::string version;

  bool yanked = false;
};

inline bool operator==(const IndexVersion& a, const IndexVersion& b) {
  return a.name == b.name && a.version == b.version;
}

// Parses one line of an index file.
absl::StatusOr<IndexVersion> ParseIndexVersion(std::string_view line);

// All published versions of one crate.
struct IndexKrate {
  // Parses the contents of an index file, one JSON object per line. Blank
  // lines are ignored, but any malformed line fails the whole file.
  static absl::StatusOr<IndexKrate> Parse(std::string_view bytes);

  IndexKrate() = default;
  explicit IndexKrate(std::vector<IndexVersion> versions)
      : versions(std::move(versions)) {}

  IndexKrate(const IndexKrate&) = default;
  IndexKrate& operator=(const IndexKrate&) = default;

  IndexKrate(IndexKrate&&) = default;
  IndexKrate& operator=(IndexKrate&&) = default;

  std::vector<IndexVersion> versions;
};

}  // namespace crates

#endif  // CRATES_KRATE_HH_
