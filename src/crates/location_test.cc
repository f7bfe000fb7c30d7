// SPDX-License-Identifier: MIT
#include "crates/location.hh"

#include <stdlib.h>

#include <filesystem>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/temp_dir.hh"

namespace fs = std::filesystem;

using crates::CratePath;
using crates::IndexLocation;
using crates::ValidateCrateName;

TEST(LocationTest, CratePaths) {
  EXPECT_EQ(CratePath("a"), "1/a");
  EXPECT_EQ(CratePath("ab"), "2/ab");
  EXPECT_EQ(CratePath("abc"), "3/a/abc");
  EXPECT_EQ(CratePath("serde"), "se/rd/serde");
  EXPECT_EQ(CratePath("Inflector"), "in/fl/inflector");
}

TEST(LocationTest, ValidatesCrateNames) {
  EXPECT_TRUE(ValidateCrateName("serde_json").ok());
  EXPECT_TRUE(ValidateCrateName("tokio-util").ok());
  EXPECT_TRUE(ValidateCrateName("a").ok());

  EXPECT_FALSE(ValidateCrateName("").ok());
  EXPECT_FALSE(ValidateCrateName("1password").ok());
  EXPECT_FALSE(ValidateCrateName("../etc/passwd").ok());
  EXPECT_FALSE(ValidateCrateName("foo bar").ok());
  EXPECT_FALSE(ValidateCrateName(std::string(65, 'a')).ok());
}

TEST(LocationTest, ClassifiesUrls) {
  yanked_test::TempDir home;
  const auto options = IndexLocation::Options().set_cargo_home(home.path());

  {
    auto location =
        IndexLocation::FromUrl("sparse+https://index.crates.io/", options);
    ASSERT_TRUE(location.ok()) << location.status();
    EXPECT_EQ(location->protocol(), IndexLocation::Protocol::SPARSE);
    EXPECT_EQ(location->BaseUrl(), "https://index.crates.io");
  }

  {
    auto location = IndexLocation::FromUrl(
        "https://github.com/rust-lang/crates.io-index", options);
    ASSERT_TRUE(location.ok()) << location.status();
    EXPECT_EQ(location->protocol(), IndexLocation::Protocol::GIT);
  }

  EXPECT_TRUE(absl::IsUnimplemented(
      IndexLocation::FromUrl("ftp://example.com/index", options).status()));
  EXPECT_TRUE(absl::IsUnimplemented(
      IndexLocation::FromUrl("not a url", options).status()));
}

TEST(LocationTest, UsesWellKnownDirectoryWhenNoneExists) {
  yanked_test::TempDir home;
  auto location = IndexLocation::FromUrl(
      IndexLocation::kCratesIoSparseUrl,
      IndexLocation::Options().set_cargo_home(home.path()));
  ASSERT_TRUE(location.ok()) << location.status();

  EXPECT_EQ(location->path(), home.path() / "registry" / "index" /
                                  "index.crates.io-1949cf8c6b5b557f");
  EXPECT_EQ(location->lock_path(), home.path() / ".package-cache");
}

TEST(LocationTest, PrefersExistingDirectory) {
  yanked_test::TempDir home;
  const fs::path registry = home.path() / "registry" / "index";
  fs::create_directories(registry / "index.crates.io-0123456789abcdef");
  fs::create_directories(registry / "index.crates.io-notahash");
  fs::create_directories(registry / "github.com-1ecc6299db9ec823");

  auto location = IndexLocation::FromUrl(
      IndexLocation::kCratesIoSparseUrl,
      IndexLocation::Options().set_cargo_home(home.path()));
  ASSERT_TRUE(location.ok()) << location.status();

  EXPECT_EQ(location->path(), registry / "index.crates.io-0123456789abcdef");
}

TEST(LocationTest, UnknownRegistryNeedsExistingDirectory) {
  yanked_test::TempDir home;
  const auto options = IndexLocation::Options().set_cargo_home(home.path());

  EXPECT_TRUE(absl::IsFailedPrecondition(
      IndexLocation::FromUrl("sparse+https://example.com/index/", options)
          .status()));

  fs::create_directories(home.path() / "registry" / "index" /
                         "example.com-fedcba9876543210");
  auto location =
      IndexLocation::FromUrl("sparse+https://example.com/index/", options);
  ASSERT_TRUE(location.ok()) << location.status();
  EXPECT_EQ(location->BaseUrl(), "https://example.com/index");
}

TEST(LocationTest, IndexDirOverridesDiscovery) {
  yanked_test::TempDir home;
  auto location = IndexLocation::FromUrl(
      "sparse+https://example.com/index/",
      IndexLocation::Options()
          .set_cargo_home(home.path())
          .set_index_dir(home.path() / "elsewhere"));
  ASSERT_TRUE(location.ok()) << location.status();

  EXPECT_EQ(location->path(), home.path() / "elsewhere");
}

TEST(LocationTest, CratesIoProtocolFromEnvironment) {
  yanked_test::TempDir home;
  const auto options = IndexLocation::Options().set_cargo_home(home.path());

  {
    auto location = IndexLocation::CratesIo(options);
    ASSERT_TRUE(location.ok()) << location.status();
    EXPECT_EQ(location->protocol(), IndexLocation::Protocol::SPARSE);
  }

  setenv("CARGO_REGISTRIES_CRATES_IO_PROTOCOL", "git", 1);
  {
    auto location = IndexLocation::CratesIo(options);
    ASSERT_TRUE(location.ok()) << location.status();
    EXPECT_EQ(location->protocol(), IndexLocation::Protocol::GIT);
    EXPECT_EQ(location->url(), IndexLocation::kCratesIoGitUrl);
  }

  setenv("CARGO_REGISTRIES_CRATES_IO_PROTOCOL", "carrier-pigeon", 1);
  EXPECT_TRUE(absl::IsUnimplemented(IndexLocation::CratesIo(options).status()));

  unsetenv("CARGO_REGISTRIES_CRATES_IO_PROTOCOL");
}

TEST(LocationTest, CargoHomeFromEnvironment) {
  yanked_test::TempDir home;
  setenv("CARGO_HOME", home.path().c_str(), 1);

  auto location = IndexLocation::CratesIo();
  unsetenv("CARGO_HOME");

  ASSERT_TRUE(location.ok()) << location.status();
  EXPECT_EQ(location->lock_path(), home.path() / ".package-cache");
}
