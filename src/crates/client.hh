// SPDX-License-Identifier: MIT
#ifndef CRATES_CLIENT_HH_
#define CRATES_CLIENT_HH_

#include <cstdint>
#include <memory>
#include <string>

#include "absl/functional/any_invocable.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "crates/request.hh"
#include "crates/response.hh"

namespace crates {

// An event loop issuing concurrent HTTP requests against a sparse index. A
// client is cheap to create and is meant to live for one batch of requests.
class Client {
 public:
  using ResponseCallback =
      absl::AnyInvocable<int(absl::StatusOr<KrateResponse>) &&>;

  enum class HttpVersion : int8_t {
    // Let curl negotiate.
    NEGOTIATE,
    HTTP1_1,
    // HTTP/2 via ALPN, falling back to HTTP/1.1.
    HTTP2,
    // HTTP/2 without negotiation. Only for servers known to support it.
    HTTP2_PRIOR_KNOWLEDGE,
  };

  struct Options {
    Options() {}

    Options(const Options&) = default;
    Options& operator=(const Options&) = default;

    Options(Options&&) = default;
    Options& operator=(Options&&) = default;

    Options& set_baseurl(std::string baseurl) {
      this->baseurl = std::move(baseurl);
      return *this;
    }
    std::string baseurl;

    Options& set_useragent(std::string useragent) {
      this->useragent = std::move(useragent);
      return *this;
    }
    std::string useragent;

    Options& set_connect_timeout(absl::Duration connect_timeout) {
      this->connect_timeout = connect_timeout;
      return *this;
    }
    absl::Duration connect_timeout = absl::Seconds(10);

    Options& set_max_connections(long max_connections) {
      this->max_connections = max_connections;
      return *this;
    }
    long max_connections = 5;

    Options& set_http_version(HttpVersion http_version) {
      this->http_version = http_version;
      return *this;
    }
    HttpVersion http_version = HttpVersion::HTTP2;
  };

  // Creates a client with its own event loop. Fails if the loop or the curl
  // multi handle cannot be set up.
  static absl::StatusOr<std::unique_ptr<Client>> New(Options options = {});

  Client() = default;
  virtual ~Client() = default;

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  Client(Client&&) = default;
  Client& operator=(Client&&) = default;

  // Asynchronously fetch a crate's index file. The callback will be invoked
  // when the call completes. It may queue further requests.
  //
  // HTTP 404, 410 and 451 are reported as NOT_FOUND, 429 as
  // RESOURCE_EXHAUSTED, and server errors, timeouts and connection failures
  // as UNAVAILABLE.
  virtual void QueueRequest(const KrateRequest& request,
                            ResponseCallback callback) = 0;

  // Runs the event loop until every queued request, including those queued
  // from callbacks, has completed. Returns -ECANCELED if an interrupt arrived
  // or a callback returned a negative value, in which case the remaining
  // requests are dropped without their callbacks running. Returns another
  // negative errno if the event loop itself failed.
  virtual int Wait() = 0;
};

}  // namespace crates

#endif  // CRATES_CLIENT_HH_
