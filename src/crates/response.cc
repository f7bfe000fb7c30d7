// SPDX-License-Identifier: MIT
#include "crates/response.hh"

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "crates/cache_entry.hh"

namespace crates {

void KrateResponse::AddHeader(std::string_view line) {
  // A status line starts the headers of a new response, such as the target of
  // a redirect. Validators from an earlier hop don't describe the final body.
  if (absl::StartsWith(line, "HTTP/")) {
    etag.clear();
    last_modified.clear();
    return;
  }

  const auto colon = line.find(':');
  if (colon == line.npos) {
    return;
  }

  const std::string_view key = absl::StripAsciiWhitespace(line.substr(0, colon));
  const std::string_view value =
      absl::StripAsciiWhitespace(line.substr(colon + 1));

  if (absl::EqualsIgnoreCase(key, "etag")) {
    etag = std::string(value);
  } else if (absl::EqualsIgnoreCase(key, "last-modified")) {
    last_modified = std::string(value);
  }
}

std::string KrateResponse::Revision() const {
  if (!etag.empty()) {
    return absl::StrCat(CacheEntry::kEtagPrefix, etag);
  }

  if (!last_modified.empty()) {
    return absl::StrCat(CacheEntry::kLastModifiedPrefix, last_modified);
  }

  return std::string();
}

}  // namespace crates
