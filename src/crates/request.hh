// SPDX-License-Identifier: MIT
#ifndef CRATES_REQUEST_HH_
#define CRATES_REQUEST_HH_

#include <string>
#include <string_view>
#include <vector>

#include "absl/time/time.h"
#include "crates/cache_entry.hh"

namespace crates {

// A request for one crate's file from a sparse index.
class KrateRequest {
 public:
  explicit KrateRequest(std::string name) : name_(std::move(name)) {}

  KrateRequest(const KrateRequest&) = delete;
  KrateRequest& operator=(const KrateRequest&) = delete;

  KrateRequest(KrateRequest&&) = default;
  KrateRequest& operator=(KrateRequest&&) = default;

  const std::string& name() const { return name_; }

  std::string Url(std::string_view baseurl) const;

  // Extra request headers, in "Name: value" form. Validators from a cached
  // copy turn the request into a conditional one.
  std::vector<std::string> Headers() const;

  // Takes the validators of the copy we already have from its cache entry.
  KrateRequest& set_cached(const CacheEntry& entry) {
    etag_ = std::string(entry.etag());
    last_modified_ = std::string(entry.last_modified());
    return *this;
  }
  const std::string& etag() const { return etag_; }
  const std::string& last_modified() const { return last_modified_; }

  // Upper bound on the whole transfer. Zero means no limit.
  KrateRequest& set_timeout(absl::Duration timeout) {
    timeout_ = timeout;
    return *this;
  }
  absl::Duration timeout() const { return timeout_; }

  // How long to wait before starting the transfer.
  KrateRequest& set_delay(absl::Duration delay) {
    delay_ = delay;
    return *this;
  }
  absl::Duration delay() const { return delay_; }

 private:
  std::string name_;
  std::string etag_;
  std::string last_modified_;
  absl::Duration timeout_;
  absl::Duration delay_;
};

}  // namespace crates

#endif  // CRATES_REQUEST_HH_
