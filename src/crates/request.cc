// SPDX-License-Identifier: MIT
#include "crates/request.hh"

#include <curl/curl.h>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "crates/location.hh"

namespace crates {

namespace {

std::string UrlEscape(const std::string_view sv) {
  char* ptr = curl_easy_escape(nullptr, sv.data(), sv.size());
  std::string escaped(ptr);
  curl_free(ptr);

  return escaped;
}

void PathSegmentFormatter(std::string* out, std::string_view segment) {
  absl::StrAppend(out, UrlEscape(segment));
}

}  // namespace

std::string KrateRequest::Url(std::string_view baseurl) const {
  absl::ConsumeSuffix(&baseurl, "/");

  const std::string path = CratePath(name_);
  const std::vector<std::string_view> segments = absl::StrSplit(path, '/');
  return absl::StrCat(baseurl, "/",
                      absl::StrJoin(segments, "/", PathSegmentFormatter));
}

std::vector<std::string> KrateRequest::Headers() const {
  std::vector<std::string> headers;

  if (!etag_.empty()) {
    headers.push_back(absl::StrCat("If-None-Match: ", etag_));
  } else if (!last_modified_.empty()) {
    headers.push_back(absl::StrCat("If-Modified-Since: ", last_modified_));
  }

  return headers;
}

}  // namespace crates
