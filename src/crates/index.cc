// SPDX-License-Identifier: MIT
#include "crates/index.hh"

#include "absl/strings/str_cat.h"

namespace crates {

absl::StatusOr<Index::BatchResults> Index::KratesBatch(
    const std::vector<std::string>&, absl::Duration) {
  return absl::UnimplementedError(absl::StrCat(
      "batch requests are not supported by ", KindToString(kind()),
      " indices"));
}

std::string_view KindToString(Index::Kind kind) {
  switch (kind) {
    case Index::Kind::GIT:
      return "git";
    case Index::Kind::SPARSE_CACHED:
      return "cached sparse";
    case Index::Kind::SPARSE_REMOTE:
      return "remote sparse";
  }

  return "unknown";
}

}  // namespace crates
