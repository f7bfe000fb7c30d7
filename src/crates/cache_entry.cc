// SPDX-License-Identifier: MIT
#include "crates/cache_entry.hh"

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"

namespace crates {

namespace {

// Splits off everything up to the next NUL. Returns false if there is none.
bool ConsumeField(std::string_view* bytes, std::string_view* field) {
  const auto nul = bytes->find('\0');
  if (nul == bytes->npos) {
    return false;
  }

  *field = bytes->substr(0, nul);
  bytes->remove_prefix(nul + 1);
  return true;
}

}  // namespace

// static
absl::StatusOr<CacheEntry> CacheEntry::Parse(std::string_view bytes) {
  if (bytes.size() < 5) {
    return absl::DataLossError("cache entry is truncated");
  }

  const auto cache_version = static_cast<uint8_t>(bytes[0]);
  if (cache_version != kCacheVersion) {
    return absl::FailedPreconditionError(
        absl::StrCat("unsupported cache version ", cache_version));
  }

  uint32_t index_version = 0;
  for (int i = 0; i < 4; ++i) {
    index_version |= static_cast<uint32_t>(static_cast<uint8_t>(bytes[1 + i]))
                     << (8 * i);
  }
  if (index_version != kIndexVersion) {
    return absl::FailedPreconditionError(
        absl::StrCat("unsupported index version ", index_version));
  }
  bytes.remove_prefix(5);

  CacheEntry entry;

  std::string_view revision;
  if (!ConsumeField(&bytes, &revision)) {
    return absl::DataLossError("cache entry has no revision");
  }
  entry.revision = std::string(revision);

  while (!bytes.empty()) {
    std::string_view version, json;
    if (!ConsumeField(&bytes, &version) || !ConsumeField(&bytes, &json)) {
      return absl::DataLossError("cache entry is truncated");
    }
    entry.versions.emplace_back(version, json);
  }

  return entry;
}

// static
absl::StatusOr<CacheEntry> CacheEntry::FromIndexFile(std::string revision,
                                                     std::string_view bytes) {
  CacheEntry entry;
  entry.revision = std::move(revision);

  for (std::string_view line : absl::StrSplit(bytes, '\n')) {
    line = absl::StripAsciiWhitespace(line);
    if (line.empty()) {
      continue;
    }

    auto version = ParseIndexVersion(line);
    if (!version.ok()) {
      return version.status();
    }

    entry.versions.emplace_back(std::move(version->version), line);
  }

  return entry;
}

std::string CacheEntry::Serialize() const {
  std::string out;
  out.push_back(static_cast<char>(kCacheVersion));
  for (int i = 0; i < 4; ++i) {
    out.push_back(static_cast<char>((kIndexVersion >> (8 * i)) & 0xff));
  }

  absl::StrAppend(&out, revision);
  out.push_back('\0');

  for (const auto& [version, json] : versions) {
    absl::StrAppend(&out, version);
    out.push_back('\0');
    absl::StrAppend(&out, json);
    out.push_back('\0');
  }

  return out;
}

absl::StatusOr<IndexKrate> CacheEntry::ToKrate() const {
  IndexKrate krate;

  for (const auto& [_, json] : versions) {
    auto version = ParseIndexVersion(json);
    if (!version.ok()) {
      return version.status();
    }
    krate.versions.push_back(*std::move(version));
  }

  if (krate.versions.empty()) {
    return absl::InvalidArgumentError("parse error: index file has no entries");
  }

  return krate;
}

std::string_view CacheEntry::etag() const {
  std::string_view rev = revision;
  return absl::ConsumePrefix(&rev, kEtagPrefix) ? rev : std::string_view();
}

std::string_view CacheEntry::last_modified() const {
  std::string_view rev = revision;
  return absl::ConsumePrefix(&rev, kLastModifiedPrefix) ? rev
                                                        : std::string_view();
}

}  // namespace crates
