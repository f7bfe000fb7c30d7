// SPDX-License-Identifier: MIT
#ifndef YANKED_ERROR_HH_
#define YANKED_ERROR_HH_

#include <cstdint>

#include "absl/status/status.h"

namespace yanked {

// The kinds of failure callers are expected to tell apart. Errors are carried
// as absl::Status; the kind is derived from the status code.
enum class ErrorKind : int8_t {
  // The index lock was not acquired in time. Retrying later may succeed.
  LOCK_TIMEOUT,
  // The index location is not one we know how to read. Not retryable.
  REGISTRY_UNSUPPORTED,
  // The registry could not be reached or returned garbage.
  REGISTRY,
  // The crate or version doesn't exist.
  NOT_FOUND,
  CANCELLED,
  IO,
};

ErrorKind GetErrorKind(const absl::Status& status);

}  // namespace yanked

#endif  // YANKED_ERROR_HH_
