// SPDX-License-Identifier: MIT
#include "crates/krate.hh"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using crates::IndexKrate;
using crates::IndexVersion;
using crates::ParseIndexVersion;
using testing::AllOf;
using testing::ElementsAre;
using testing::Field;
using testing::HasSubstr;

TEST(KrateTest, ParsesIndexLine) {
  const auto version = ParseIndexVersion(
      R"({"name":"serde","vers":"1.0.100","deps":[{"name":"serde_derive","req":"=1.0.100","features":[],"optional":true,"default_features":true,"target":null,"kind":"normal"}],"cksum":"f4473e8506b213730ff2061073b48fa51dcc66349219e2e7c5608f0296a1d95a","features":{"derive":["serde_derive"]},"yanked":true,"links":null,"rust_version":"1.15"})");
  ASSERT_TRUE(version.ok()) << version.status();

  EXPECT_EQ(version->name, "serde");
  EXPECT_EQ(version->version, "1.0.100");
  EXPECT_TRUE(version->yanked);
}

TEST(KrateTest, IgnoresNullFields) {
  const auto version =
      ParseIndexVersion(R"({"name":"log","vers":"0.4.0","yanked":null})");
  ASSERT_TRUE(version.ok()) << version.status();

  EXPECT_FALSE(version->yanked);
}

TEST(KrateTest, YankedDefaultsToFalse) {
  const auto version = ParseIndexVersion(R"({"name":"log","vers":"0.4.0"})");
  ASSERT_TRUE(version.ok()) << version.status();

  EXPECT_FALSE(version->yanked);
}

TEST(KrateTest, KeepsVersionsWhichAreNotSemver) {
  const auto version =
      ParseIndexVersion(R"({"name":"weird","vers":"0.1.0-alpha.01+build"})");
  ASSERT_TRUE(version.ok()) << version.status();

  EXPECT_EQ(version->version, "0.1.0-alpha.01+build");
}

TEST(KrateTest, RejectsBadLines) {
  EXPECT_THAT(ParseIndexVersion("{").status().message(),
              HasSubstr("parse error"));
  EXPECT_FALSE(ParseIndexVersion("[]").ok());
  EXPECT_FALSE(ParseIndexVersion(R"({"name":"foo"})").ok());
  EXPECT_FALSE(ParseIndexVersion(R"({"vers":"1.0.0"})").ok());
  EXPECT_FALSE(ParseIndexVersion(R"({"name":"foo","vers":1})").ok());
}

TEST(KrateTest, ParsesIndexFile) {
  const auto krate = IndexKrate::Parse(
      "{\"name\":\"Foo\",\"vers\":\"0.1.0\",\"yanked\":false}\n"
      "\n"
      "{\"name\":\"foo\",\"vers\":\"0.2.0\",\"yanked\":true}\n");
  ASSERT_TRUE(krate.ok()) << krate.status();

  EXPECT_THAT(
      krate->versions,
      ElementsAre(AllOf(Field(&IndexVersion::name, "Foo"),
                        Field(&IndexVersion::version, "0.1.0"),
                        Field(&IndexVersion::yanked, false)),
                  AllOf(Field(&IndexVersion::name, "foo"),
                        Field(&IndexVersion::version, "0.2.0"),
                        Field(&IndexVersion::yanked, true))));
}

TEST(KrateTest, RejectsEmptyIndexFile) {
  EXPECT_FALSE(IndexKrate::Parse("").ok());
  EXPECT_FALSE(IndexKrate::Parse("\n\n").ok());
}

TEST(KrateTest, OneBadLineFailsTheFile) {
  EXPECT_FALSE(IndexKrate::Parse("{\"name\":\"foo\",\"vers\":\"0.1.0\"}\n"
                                 "garbage\n")
                   .ok());
}
