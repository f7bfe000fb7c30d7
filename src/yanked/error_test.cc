// SPDX-License-Identifier: MIT
#include "yanked/error.hh"

#include "gtest/gtest.h"

using yanked::ErrorKind;
using yanked::GetErrorKind;

TEST(ErrorTest, ClassifiesByStatusCode) {
  EXPECT_EQ(GetErrorKind(absl::DeadlineExceededError("")),
            ErrorKind::LOCK_TIMEOUT);
  EXPECT_EQ(GetErrorKind(absl::UnimplementedError("")),
            ErrorKind::REGISTRY_UNSUPPORTED);
  EXPECT_EQ(GetErrorKind(absl::UnavailableError("")), ErrorKind::REGISTRY);
  EXPECT_EQ(GetErrorKind(absl::NotFoundError("")), ErrorKind::NOT_FOUND);
  EXPECT_EQ(GetErrorKind(absl::CancelledError("")), ErrorKind::CANCELLED);
  EXPECT_EQ(GetErrorKind(absl::InternalError("")), ErrorKind::IO);
  EXPECT_EQ(GetErrorKind(absl::DataLossError("")), ErrorKind::IO);
}
