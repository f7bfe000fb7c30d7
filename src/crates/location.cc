// SPDX-License-Identifier: MIT
#include "crates/location.hh"

#include <cstdlib>
#include <optional>
#include <system_error>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/strip.h"

namespace fs = std::filesystem;

namespace crates {

namespace {

// Directory names cargo gives the crates.io index when it creates it. The
// suffix is a hash of the URL, computed in a way which depends on the cargo
// release, so an existing directory is always preferred.
constexpr std::string_view kCratesIoGitDir = "github.com-1ecc6299db9ec823";
constexpr std::string_view kCratesIoSparseDir =
    "index.crates.io-1949cf8c6b5b557f";

constexpr size_t kMaxCrateNameLength = 64;

std::string_view GetEnv(const char* name) {
  const auto* value = getenv(name);
  return value ? std::string_view(value) : std::string_view();
}

absl::StatusOr<fs::path> CargoHome(const fs::path& configured) {
  if (!configured.empty()) {
    return configured;
  }

  if (auto cargo_home = GetEnv("CARGO_HOME"); !cargo_home.empty()) {
    return fs::path(cargo_home);
  }

  if (auto home = GetEnv("HOME"); !home.empty()) {
    return fs::path(home) / ".cargo";
  }

  return absl::FailedPreconditionError(
      "unable to find cargo home: neither CARGO_HOME nor HOME is set");
}

// Returns the host component of a URL, e.g. "index.crates.io".
std::string_view UrlHost(std::string_view url) {
  absl::ConsumePrefix(&url, "sparse+");
  if (auto scheme = url.find("://"); scheme != url.npos) {
    url.remove_prefix(scheme + 3);
  }
  if (auto at = url.find('@'); at != url.npos && at < url.find('/')) {
    url.remove_prefix(at + 1);
  }
  return url.substr(0, url.find_first_of(":/"));
}

bool IsHashSuffix(std::string_view suffix) {
  if (suffix.size() != 16) {
    return false;
  }
  for (char c : suffix) {
    if (!absl::ascii_isxdigit(c)) {
      return false;
    }
  }
  return true;
}

// Finds the most recently used "<host>-<hash>" directory in the registry.
std::optional<fs::path> FindIndexDir(const fs::path& registry,
                                     std::string_view host) {
  std::error_code ec;
  fs::directory_iterator iter(registry, ec);
  if (ec) {
    return std::nullopt;
  }

  std::optional<fs::path> best;
  fs::file_time_type best_mtime;
  for (const auto& entry : iter) {
    if (!entry.is_directory(ec)) {
      continue;
    }

    const std::string name = entry.path().filename().string();
    std::string_view filename = name;
    if (!absl::ConsumePrefix(&filename, host) ||
        !absl::ConsumePrefix(&filename, "-") || !IsHashSuffix(filename)) {
      continue;
    }

    auto mtime = entry.last_write_time(ec);
    if (ec) {
      continue;
    }

    if (!best.has_value() || mtime > best_mtime) {
      best = entry.path();
      best_mtime = mtime;
    }
  }

  return best;
}

}  // namespace

std::string CratePath(std::string_view name) {
  const std::string lower = absl::AsciiStrToLower(name);

  switch (lower.size()) {
    case 0:
      return std::string();
    case 1:
      return absl::StrCat("1/", lower);
    case 2:
      return absl::StrCat("2/", lower);
    case 3:
      return absl::StrCat("3/", lower.substr(0, 1), "/", lower);
    default:
      return absl::StrCat(lower.substr(0, 2), "/", lower.substr(2, 2), "/",
                          lower);
  }
}

absl::Status ValidateCrateName(std::string_view name) {
  if (name.empty()) {
    return absl::InvalidArgumentError("crate name is empty");
  }

  if (name.size() > kMaxCrateNameLength) {
    return absl::InvalidArgumentError(
        absl::StrCat("crate name is longer than ", kMaxCrateNameLength,
                     " characters: ", name));
  }

  if (!absl::ascii_isalpha(name.front())) {
    return absl::InvalidArgumentError(
        absl::StrCat("crate name must start with a letter: ", name));
  }

  for (char c : name) {
    if (!absl::ascii_isalnum(c) && c != '-' && c != '_') {
      return absl::InvalidArgumentError(
          absl::StrCat("invalid character in crate name: ", name));
    }
  }

  return absl::OkStatus();
}

// static
absl::StatusOr<IndexLocation> IndexLocation::CratesIo(Options options) {
  const std::string_view protocol =
      GetEnv("CARGO_REGISTRIES_CRATES_IO_PROTOCOL");

  if (protocol.empty() || protocol == "sparse") {
    return FromUrl(kCratesIoSparseUrl, std::move(options));
  }

  if (protocol == "git") {
    return FromUrl(kCratesIoGitUrl, std::move(options));
  }

  return absl::UnimplementedError(absl::StrCat(
      "unsupported crates.io index protocol '", protocol,
      "' in CARGO_REGISTRIES_CRATES_IO_PROTOCOL"));
}

// static
absl::StatusOr<IndexLocation> IndexLocation::FromUrl(std::string_view url,
                                                     Options options) {
  Protocol protocol;
  if (absl::StartsWith(url, "sparse+http://") ||
      absl::StartsWith(url, "sparse+https://")) {
    protocol = Protocol::SPARSE;
  } else if (absl::StartsWith(url, "https://") ||
             absl::StartsWith(url, "http://") ||
             absl::StartsWith(url, "ssh://") ||
             absl::StartsWith(url, "git://") ||
             absl::StartsWith(url, "file://")) {
    protocol = Protocol::GIT;
  } else {
    return absl::UnimplementedError(
        absl::StrCat("unsupported registry index location: ", url));
  }

  auto cargo_home = CargoHome(options.cargo_home);
  if (!cargo_home.ok()) {
    return cargo_home.status();
  }

  if (!options.index_dir.empty()) {
    return IndexLocation(protocol, std::string(url), *std::move(cargo_home),
                         std::move(options.index_dir));
  }

  const fs::path registry = *cargo_home / "registry" / "index";
  const std::string_view host = UrlHost(url);

  if (auto dir = FindIndexDir(registry, host); dir.has_value()) {
    return IndexLocation(protocol, std::string(url), *std::move(cargo_home),
                         *std::move(dir));
  }

  if (url == kCratesIoSparseUrl) {
    return IndexLocation(protocol, std::string(url), *cargo_home,
                         registry / kCratesIoSparseDir);
  }

  if (url == kCratesIoGitUrl) {
    return IndexLocation(protocol, std::string(url), *cargo_home,
                         registry / kCratesIoGitDir);
  }

  return absl::FailedPreconditionError(
      absl::StrCat("no local directory found for index ", url, " in ",
                   registry.string()));
}

std::string IndexLocation::BaseUrl() const {
  std::string_view url = url_;
  absl::ConsumePrefix(&url, "sparse+");
  absl::ConsumeSuffix(&url, "/");
  return std::string(url);
}

}  // namespace crates
