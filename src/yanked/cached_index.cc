// SPDX-License-Identifier: MIT
#include "yanked/cached_index.hh"

#include "absl/container/btree_set.h"
#include "absl/strings/str_cat.h"
#include "crates/git_index.hh"
#include "crates/sparse_index.hh"

#ifndef PROJECT_VERSION
#define PROJECT_VERSION "unknown"
#endif

namespace yanked {

namespace {

struct PackagePtrLess {
  bool operator()(const Package* a, const Package* b) const { return *a < *b; }
};

crates::Client::Options BatchClientOptions(
    std::optional<crates::Client::Options> options) {
  crates::Client::Options batch_options =
      options.has_value() ? *std::move(options) : crates::Client::Options();

  if (batch_options.useragent.empty()) {
    batch_options.set_useragent("yanked/" PROJECT_VERSION);
  }

  // index.crates.io speaks HTTP/2, and multiplexing a batch over a handful of
  // connections is much cheaper than negotiating each one.
  batch_options.set_http_version(
      crates::Client::HttpVersion::HTTP2_PRIOR_KNOWLEDGE);

  return batch_options;
}

}  // namespace

// static
absl::StatusOr<CachedIndex> CachedIndex::Fetch(
    std::optional<crates::Client::Options> client_options,
    absl::Duration lock_timeout) {
  auto location = crates::IndexLocation::CratesIo();
  if (!location.ok()) {
    return location.status();
  }

  return Fetch(*std::move(location), std::move(client_options), lock_timeout);
}

// static
absl::StatusOr<CachedIndex> CachedIndex::Fetch(
    crates::IndexLocation location,
    std::optional<crates::Client::Options> client_options,
    absl::Duration lock_timeout) {
  switch (location.protocol()) {
    case crates::IndexLocation::Protocol::GIT: {
      auto index = crates::GitIndex::Open(std::move(location), lock_timeout);
      if (!index.ok()) {
        return index.status();
      }

      if (!(*index)->fetched_on_open()) {
        if (auto status = (*index)->Fetch(); !status.ok()) {
          return status;
        }
      }

      return CachedIndex(*std::move(index));
    }
    case crates::IndexLocation::Protocol::SPARSE:
      return CachedIndex(std::make_unique<crates::RemoteSparseIndex>(
          crates::SparseIndex(std::move(location)),
          BatchClientOptions(std::move(client_options))));
  }

  return absl::UnimplementedError("unsupported index protocol");
}

// static
absl::StatusOr<CachedIndex> CachedIndex::Open(absl::Duration lock_timeout) {
  auto location = crates::IndexLocation::CratesIo();
  if (!location.ok()) {
    return location.status();
  }

  return Open(*std::move(location), lock_timeout);
}

// static
absl::StatusOr<CachedIndex> CachedIndex::Open(crates::IndexLocation location,
                                              absl::Duration lock_timeout) {
  switch (location.protocol()) {
    case crates::IndexLocation::Protocol::GIT: {
      auto index = crates::GitIndex::Open(std::move(location), lock_timeout);
      if (!index.ok()) {
        return index.status();
      }

      return CachedIndex(*std::move(index));
    }
    case crates::IndexLocation::Protocol::SPARSE:
      return CachedIndex(std::make_unique<crates::CachedSparseIndex>(
          crates::SparseIndex(std::move(location))));
  }

  return absl::UnimplementedError("unsupported index protocol");
}

absl::Status CachedIndex::PopulateCache(const std::vector<std::string>& names) {
  std::vector<std::string> missing;
  for (const auto& name : names) {
    if (!cache_.Contains(name)) {
      missing.push_back(name);
    }
  }

  if (missing.empty()) {
    return absl::OkStatus();
  }

  switch (index_->kind()) {
    case crates::Index::Kind::GIT:
    case crates::Index::Kind::SPARSE_CACHED:
      for (auto& name : missing) {
        auto result = index_->Krate(name);
        cache_.Insert(std::move(name), std::move(result));
      }
      return absl::OkStatus();
    case crates::Index::Kind::SPARSE_REMOTE: {
      auto results = index_->KratesBatch(missing, kRequestTimeout);
      if (!results.ok()) {
        return results.status();
      }

      for (auto& [name, result] : *results) {
        cache_.Insert(name, std::move(result));
      }
      return absl::OkStatus();
    }
  }

  return absl::OkStatus();
}

absl::StatusOr<bool> CachedIndex::IsYanked(const Package& package) {
  const YankCache::Entry* entry = cache_.Lookup(package.name);
  if (entry == nullptr) {
    entry = &cache_.Insert(package.name, index_->Krate(package.name));
  }

  if (!entry->ok()) {
    return absl::UnavailableError(
        absl::StrCat("failed to retrieve ", package.name,
                     " from crates.io index: ", entry->status().message()));
  }

  if (!entry->value().has_value()) {
    return absl::NotFoundError(absl::StrCat("no such crate: ", package.name));
  }

  const auto& versions = *entry->value();
  auto iter = versions.find(package.version);
  if (iter == versions.end()) {
    return absl::NotFoundError(
        absl::StrCat("no such version: ", package.name, " ", package.version));
  }

  return iter->second;
}

std::vector<absl::StatusOr<const Package*>> CachedIndex::FindYanked(
    absl::Span<const Package> packages) {
  absl::btree_set<const Package*, PackagePtrLess> unique;
  absl::btree_set<std::string> names;
  for (const auto& package : packages) {
    if (unique.insert(&package).second) {
      names.insert(package.name);
    }
  }

  std::vector<absl::StatusOr<const Package*>> results;

  if (auto status =
          PopulateCache(std::vector<std::string>(names.begin(), names.end()));
      !status.ok()) {
    results.push_back(absl::UnavailableError(
        absl::StrCat("failed to download crates.io index: ", status.message(),
                     "\nData may be missing or stale when checking for "
                     "yanked packages.")));
  }

  for (const Package* package : unique) {
    auto yanked = IsYanked(*package);
    if (!yanked.ok()) {
      results.push_back(yanked.status());
    } else if (*yanked) {
      results.push_back(package);
    }
  }

  return results;
}

}  // namespace yanked
