// SPDX-License-Identifier: MIT
#include "crates/request.hh"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

constexpr char kBaseUrl[] = "https://index.crates.io";

using crates::CacheEntry;
using crates::KrateRequest;
using testing::ElementsAre;
using testing::IsEmpty;

namespace {

CacheEntry Cached(std::string revision) {
  CacheEntry entry;
  entry.revision = std::move(revision);
  return entry;
}

}  // namespace

TEST(RequestTest, BuildsUrlsFromCratePath) {
  EXPECT_EQ(KrateRequest("serde").Url(kBaseUrl),
            "https://index.crates.io/se/rd/serde");
  EXPECT_EQ(KrateRequest("syn").Url(kBaseUrl),
            "https://index.crates.io/3/s/syn");
  EXPECT_EQ(KrateRequest("Inflector").Url(kBaseUrl),
            "https://index.crates.io/in/fl/inflector");
}

TEST(RequestTest, IgnoresTrailingSlashOnBaseUrl) {
  EXPECT_EQ(KrateRequest("cc").Url("https://index.crates.io/"),
            "https://index.crates.io/2/cc");
}

TEST(RequestTest, UnconditionalWithoutRevision) {
  EXPECT_THAT(KrateRequest("serde").Headers(), IsEmpty());
}

TEST(RequestTest, EtagMakesRequestConditional) {
  KrateRequest request("serde");
  request.set_cached(Cached("etag: \"d41d8cd98f00b204\""));

  EXPECT_THAT(request.Headers(),
              ElementsAre("If-None-Match: \"d41d8cd98f00b204\""));
}

TEST(RequestTest, LastModifiedMakesRequestConditional) {
  KrateRequest request("serde");
  request.set_cached(Cached("last-modified: Wed, 21 Oct 2015 07:28:00 GMT"));

  EXPECT_THAT(request.Headers(),
              ElementsAre("If-Modified-Since: Wed, 21 Oct 2015 07:28:00 GMT"));
}

TEST(RequestTest, IgnoresUnknownRevisions) {
  KrateRequest request("serde");
  request.set_cached(Cached("0123456789abcdef"));

  EXPECT_THAT(request.Headers(), IsEmpty());
}

TEST(RequestTest, CarriesTimeoutAndDelay) {
  KrateRequest request("serde");
  request.set_timeout(absl::Seconds(10)).set_delay(absl::Milliseconds(200));

  EXPECT_EQ(request.timeout(), absl::Seconds(10));
  EXPECT_EQ(request.delay(), absl::Milliseconds(200));
}
