// SPDX-License-Identifier: MIT
#ifndef CRATES_LOCATION_HH_
#define CRATES_LOCATION_HH_

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "absl/status/statusor.h"

namespace crates {

// Returns the path of a crate's file relative to the root of an index, e.g.
// "se/rd/serde" or "3/l/log". The path is always lowercase.
std::string CratePath(std::string_view name);

// Checks that a name is one the registry could have published: 1 to 64
// ASCII characters, starting with a letter, otherwise only alphanumerics,
// '-' and '_'. Returns INVALID_ARGUMENT otherwise.
absl::Status ValidateCrateName(std::string_view name);

// Where an index lives: its remote URL, and the local directory holding
// either the git repository or the sparse cache.
class IndexLocation {
 public:
  enum class Protocol : int8_t {
    GIT,
    SPARSE,
  };

  struct Options {
    Options() = default;

    Options(const Options&) = default;
    Options& operator=(const Options&) = default;

    Options(Options&&) = default;
    Options& operator=(Options&&) = default;

    // Root of cargo's local data. Defaults to $CARGO_HOME, or ~/.cargo.
    Options& set_cargo_home(std::filesystem::path cargo_home) {
      this->cargo_home = std::move(cargo_home);
      return *this;
    }
    std::filesystem::path cargo_home;

    // Overrides discovery of the index directory beneath the cargo home.
    Options& set_index_dir(std::filesystem::path index_dir) {
      this->index_dir = std::move(index_dir);
      return *this;
    }
    std::filesystem::path index_dir;
  };

  static constexpr std::string_view kCratesIoGitUrl =
      "https://github.com/rust-lang/crates.io-index";
  static constexpr std::string_view kCratesIoSparseUrl =
      "sparse+https://index.crates.io/";

  // Locates the crates.io index. The protocol is taken from
  // CARGO_REGISTRIES_CRATES_IO_PROTOCOL ("git" or "sparse", defaulting to
  // sparse). Any other value is reported as UNIMPLEMENTED.
  static absl::StatusOr<IndexLocation> CratesIo(Options options = {});

  // Locates the index served from the given URL. URLs prefixed with
  // "sparse+" are sparse indices, http(s), ssh, git and file URLs are git
  // indices, and anything else is UNIMPLEMENTED.
  static absl::StatusOr<IndexLocation> FromUrl(std::string_view url,
                                               Options options = {});

  Protocol protocol() const { return protocol_; }

  // The URL as configured, including any "sparse+" prefix.
  const std::string& url() const { return url_; }

  // The URL to issue HTTP requests against: no "sparse+" prefix and no
  // trailing slash.
  std::string BaseUrl() const;

  // Local directory of the index.
  const std::filesystem::path& path() const { return path_; }

  // The file locked while a git index is in use. This is the same lock cargo
  // takes around its package cache.
  std::filesystem::path lock_path() const {
    return cargo_home_ / ".package-cache";
  }

 private:
  IndexLocation(Protocol protocol, std::string url,
                std::filesystem::path cargo_home, std::filesystem::path path)
      : protocol_(protocol),
        url_(std::move(url)),
        cargo_home_(std::move(cargo_home)),
        path_(std::move(path)) {}

  Protocol protocol_;
  std::string url_;
  std::filesystem::path cargo_home_;
  std::filesystem::path path_;
};

}  // namespace crates

#endif  // CRATES_LOCATION_HH_
