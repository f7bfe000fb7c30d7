// SPDX-License-Identifier: MIT
#include "yanked/error.hh"

namespace yanked {

ErrorKind GetErrorKind(const absl::Status& status) {
  switch (status.code()) {
    case absl::StatusCode::kDeadlineExceeded:
      return ErrorKind::LOCK_TIMEOUT;
    case absl::StatusCode::kUnimplemented:
      return ErrorKind::REGISTRY_UNSUPPORTED;
    case absl::StatusCode::kUnavailable:
      return ErrorKind::REGISTRY;
    case absl::StatusCode::kNotFound:
      return ErrorKind::NOT_FOUND;
    case absl::StatusCode::kCancelled:
      return ErrorKind::CANCELLED;
    default:
      return ErrorKind::IO;
  }
}

}  // namespace yanked
