// SPDX-License-Identifier: MIT
#include "crates/file_lock.hh"

#include <csignal>
#include <filesystem>

#include "absl/time/clock.h"
#include "crates/interrupt.hh"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/temp_dir.hh"

using crates::FileLock;
using testing::HasSubstr;

TEST(FileLockTest, CreatesLockFile) {
  yanked_test::TempDir dir;
  const auto path = dir.path() / "sub" / ".package-cache";

  auto lock = FileLock::Acquire(path, absl::ZeroDuration());
  ASSERT_TRUE(lock.ok()) << lock.status();

  EXPECT_TRUE(std::filesystem::exists(path));
  EXPECT_EQ(lock->path(), path);
}

TEST(FileLockTest, ZeroTimeoutFailsImmediatelyWhenHeld) {
  yanked_test::TempDir dir;
  const auto path = dir.path() / ".package-cache";

  auto held = FileLock::Acquire(path, absl::ZeroDuration());
  ASSERT_TRUE(held.ok()) << held.status();

  const absl::Time start = absl::Now();
  auto second = FileLock::Acquire(path, absl::ZeroDuration());
  EXPECT_LT(absl::Now() - start, absl::Seconds(1));

  EXPECT_TRUE(absl::IsDeadlineExceeded(second.status()));
  EXPECT_THAT(second.status().message(), HasSubstr("timed out"));
}

TEST(FileLockTest, WaitsUpToTimeout) {
  yanked_test::TempDir dir;
  const auto path = dir.path() / ".package-cache";

  auto held = FileLock::Acquire(path, absl::ZeroDuration());
  ASSERT_TRUE(held.ok()) << held.status();

  const absl::Time start = absl::Now();
  auto second = FileLock::Acquire(path, absl::Milliseconds(200));
  EXPECT_GE(absl::Now() - start, absl::Milliseconds(200));

  EXPECT_TRUE(absl::IsDeadlineExceeded(second.status()));
}

TEST(FileLockTest, ReleasedWhenDestroyed) {
  yanked_test::TempDir dir;
  const auto path = dir.path() / ".package-cache";

  {
    auto held = FileLock::Acquire(path, absl::ZeroDuration());
    ASSERT_TRUE(held.ok()) << held.status();
  }

  EXPECT_TRUE(FileLock::Acquire(path, absl::ZeroDuration()).ok());
}

TEST(FileLockTest, MovingKeepsTheLock) {
  yanked_test::TempDir dir;
  const auto path = dir.path() / ".package-cache";

  auto held = FileLock::Acquire(path, absl::ZeroDuration());
  ASSERT_TRUE(held.ok()) << held.status();

  {
    FileLock moved = *std::move(held);
    EXPECT_FALSE(FileLock::Acquire(path, absl::ZeroDuration()).ok());
  }

  EXPECT_TRUE(FileLock::Acquire(path, absl::ZeroDuration()).ok());
}

TEST(FileLockTest, InterruptCancelsWait) {
  yanked_test::TempDir dir;
  const auto path = dir.path() / ".package-cache";

  auto held = FileLock::Acquire(path, absl::ZeroDuration());
  ASSERT_TRUE(held.ok()) << held.status();

  crates::InstallInterruptHandler();
  raise(SIGINT);
  ASSERT_TRUE(crates::IsInterrupted());

  auto second = FileLock::Acquire(path, absl::Seconds(30));
  crates::ResetInterrupted();

  EXPECT_TRUE(absl::IsCancelled(second.status()));
}
