// SPDX-License-Identifier: MIT
#include "crates/sparse_index.hh"

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>

#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"

namespace fs = std::filesystem;

namespace crates {

namespace {

constexpr absl::Duration kInitialRetryBackoff = absl::Milliseconds(100);
constexpr absl::Duration kMaxRetryBackoff = absl::Seconds(1);

}  // namespace

bool IsTransientError(const absl::Status& status) {
  return absl::IsUnavailable(status) || absl::IsResourceExhausted(status);
}

absl::Duration RetryBackoff(int attempt) {
  if (attempt <= 0) {
    return absl::ZeroDuration();
  }

  absl::Duration backoff = kInitialRetryBackoff;
  for (int i = 1; i < attempt && backoff < kMaxRetryBackoff; ++i) {
    backoff *= 2;
  }

  return std::min(backoff, kMaxRetryBackoff);
}

fs::path SparseIndex::CachePath(std::string_view name) const {
  return location_.path() / ".cache" / CratePath(name);
}

absl::StatusOr<std::optional<CacheEntry>> SparseIndex::ReadCacheEntry(
    std::string_view name) const {
  const fs::path path = CachePath(name);

  std::error_code ec;
  if (!fs::exists(path, ec)) {
    if (ec) {
      return absl::InternalError(absl::StrCat("failed to stat ", path.string(),
                                              ": ", ec.message()));
    }
    return std::nullopt;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return absl::InternalError(absl::StrCat("failed to open ", path.string(),
                                            ": ", strerror(errno)));
  }

  std::string bytes((std::istreambuf_iterator<char>(file)),
                    std::istreambuf_iterator<char>());
  if (file.bad()) {
    return absl::InternalError(
        absl::StrCat("failed to read ", path.string()));
  }

  auto entry = CacheEntry::Parse(bytes);
  if (absl::IsFailedPrecondition(entry.status())) {
    // Written by some other version of the cache. Treat it as a miss; the
    // next fetch overwrites it.
    return std::nullopt;
  }
  if (!entry.ok()) {
    return absl::DataLossError(absl::StrCat(
        "corrupt cache entry ", path.string(), ": ", entry.status().message()));
  }

  return *std::move(entry);
}

absl::StatusOr<std::optional<IndexKrate>> SparseIndex::CachedKrate(
    std::string_view name) const {
  if (auto status = ValidateCrateName(name); !status.ok()) {
    return status;
  }

  auto entry = ReadCacheEntry(name);
  if (!entry.ok()) {
    return entry.status();
  }

  if (!entry->has_value()) {
    return std::nullopt;
  }

  auto krate = (*entry)->ToKrate();
  if (!krate.ok()) {
    return krate.status();
  }

  return *std::move(krate);
}

absl::Status SparseIndex::WriteCacheEntry(std::string_view name,
                                          const CacheEntry& entry) const {
  const fs::path path = CachePath(name);

  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    return absl::InternalError(absl::StrCat("failed to create ",
                                            path.parent_path().string(), ": ",
                                            ec.message()));
  }

  fs::path tmp = path;
  tmp += absl::StrCat(".tmp.", getpid());

  {
    std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
    file << entry.Serialize();
    file.close();
    if (!file) {
      fs::remove(tmp, ec);
      return absl::InternalError(
          absl::StrCat("failed to write ", tmp.string()));
    }
  }

  fs::rename(tmp, path, ec);
  if (ec) {
    fs::remove(tmp, ec);
    return absl::InternalError(absl::StrCat("failed to rename ", tmp.string(),
                                            " to ", path.string()));
  }

  return absl::OkStatus();
}

RemoteSparseIndex::RemoteSparseIndex(SparseIndex index,
                                     Client::Options options)
    : index_(std::move(index)), options_(std::move(options)) {
  if (options_.baseurl.empty()) {
    options_.baseurl = index_.location().BaseUrl();
  }
}

absl::StatusOr<Index::BatchResults> RemoteSparseIndex::KratesBatch(
    const std::vector<std::string>& names, absl::Duration per_item_timeout) {
  BatchResults results;
  if (names.empty()) {
    return results;
  }

  auto client = Client::New(options_);
  if (!client.ok()) {
    return absl::UnavailableError(
        absl::StrCat("unable to start the request loop: ",
                     client.status().message()));
  }

  const absl::Time deadline = absl::Now() + per_item_timeout;
  for (const auto& name : names) {
    if (auto status = ValidateCrateName(name); !status.ok()) {
      results.insert_or_assign(name, status);
      continue;
    }
    QueueKrateRequest(**client, name, deadline, /*attempt=*/0, results);
  }

  if (int r = (*client)->Wait(); r < 0) {
    // Requests still in flight were dropped. Give each of their crates the
    // loop's failure so they aren't mistaken for absent ones.
    const absl::Status status =
        r == -ECANCELED
            ? absl::CancelledError("interrupted while fetching crates")
            : absl::UnavailableError(
                  absl::StrCat("batch request failed: ", strerror(-r)));
    for (const auto& name : names) {
      if (!results.contains(name)) {
        results.insert_or_assign(name, status);
      }
    }
  }

  return results;
}

void RemoteSparseIndex::QueueKrateRequest(Client& client,
                                          const std::string& name,
                                          absl::Time deadline, int attempt,
                                          BatchResults& results) {
  KrateRequest request(name);

  // Only send validators for an entry we could actually fall back to.
  if (auto cached = index_.ReadCacheEntry(name);
      cached.ok() && cached->has_value()) {
    request.set_cached(**cached);
  }

  const absl::Duration delay = RetryBackoff(attempt);
  request.set_delay(delay);
  request.set_timeout(std::max(deadline - absl::Now() - delay,
                               absl::Milliseconds(1)));

  client.QueueRequest(
      request, [this, &client, &results, name, deadline,
                attempt](absl::StatusOr<KrateResponse> response) {
        if (IsTransientError(response.status()) &&
            absl::Now() + RetryBackoff(attempt + 1) < deadline) {
          QueueKrateRequest(client, name, deadline, attempt + 1, results);
          return 0;
        }

        results.insert_or_assign(name,
                                 HandleResponse(name, std::move(response)));
        return 0;
      });
}

Index::KrateResult RemoteSparseIndex::HandleResponse(
    const std::string& name, absl::StatusOr<KrateResponse> response) {
  if (absl::IsNotFound(response.status())) {
    return std::nullopt;
  }

  if (!response.ok()) {
    return response.status();
  }

  if (response->not_modified) {
    return index_.CachedKrate(name);
  }

  auto entry = CacheEntry::FromIndexFile(response->Revision(), response->bytes);
  if (!entry.ok()) {
    return entry.status();
  }

  if (auto status = index_.WriteCacheEntry(name, *entry); !status.ok()) {
    std::cerr << "warning: failed to cache index entry for " << name << ": "
              << status.message() << "\n";
  }

  auto krate = entry->ToKrate();
  if (!krate.ok()) {
    return krate.status();
  }

  return *std::move(krate);
}

}  // namespace crates
