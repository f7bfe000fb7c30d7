// SPDX-License-Identifier: MIT
#ifndef CRATES_RESPONSE_HH_
#define CRATES_RESPONSE_HH_

#include <string>
#include <string_view>

namespace crates {

struct KrateResponse {
  KrateResponse() = default;

  KrateResponse(const KrateResponse&) = delete;
  KrateResponse& operator=(const KrateResponse&) = delete;

  KrateResponse(KrateResponse&&) = default;
  KrateResponse& operator=(KrateResponse&&) = default;

  // Records the validators from one raw response header line. Other headers
  // are ignored.
  void AddHeader(std::string_view line);

  // The revision to store in the cache alongside this response: the ETag if
  // the server sent one, otherwise Last-Modified, otherwise nothing.
  std::string Revision() const;

  // Set when the server answered 304 and the cached copy is current. The
  // body is empty in that case.
  bool not_modified = false;

  std::string bytes;
  std::string etag;
  std::string last_modified;
};

}  // namespace crates

#endif  // CRATES_RESPONSE_HH_
