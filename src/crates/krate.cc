// SPDX-License-Identifier: MIT
#include "crates/krate.hh"

#include <functional>
#include <string_view>

#include "absl/base/no_destructor.h"
#include "absl/container/flat_hash_map.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "nlohmann/json.hpp"

namespace crates {

namespace {

using FieldParser = std::function<void(const nlohmann::json&, IndexVersion&)>;

template <typename FieldType>
FieldParser ParseInto(FieldType IndexVersion::*field) {
  return [field](const nlohmann::json& j, IndexVersion& v) {
    j.get_to<FieldType>(v.*field);
  };
}

// Fills in the fields we care about. Unknown keys are ignored, and so are
// nulls, which the index uses for absent optional fields.
void from_json(const nlohmann::json& j, IndexVersion& v) {
  // clang-format off
  static const absl::NoDestructor<
      absl::flat_hash_map<std::string_view, FieldParser>> kFields({
    { "name",             ParseInto(&IndexVersion::name) },
    { "vers",             ParseInto(&IndexVersion::version) },
    { "yanked",           ParseInto(&IndexVersion::yanked) },
  });
  // clang-format on

  for (const auto& [key, value] : j.items()) {
    if (value.is_null()) {
      continue;
    }

    if (const auto iter = kFields->find(key); iter != kFields->end()) {
      iter->second(value, v);
    }
  }
}

}  // namespace

absl::StatusOr<IndexVersion> ParseIndexVersion(std::string_view line) {
  IndexVersion version;

  try {
    const auto j = nlohmann::json::parse(line);
    if (!j.is_object()) {
      return absl::InvalidArgumentError(
          "parse error: index entry is not an object");
    }
    from_json(j, version);
  } catch (const nlohmann::json::exception& e) {
    return absl::InvalidArgumentError(absl::StrCat("parse error: ", e.what()));
  }

  if (version.name.empty() || version.version.empty()) {
    return absl::InvalidArgumentError(
        "parse error: index entry lacks a name or version");
  }

  return version;
}

// static
absl::StatusOr<IndexKrate> IndexKrate::Parse(std::string_view bytes) {
  IndexKrate krate;

  for (std::string_view line : absl::StrSplit(bytes, '\n')) {
    line = absl::StripAsciiWhitespace(line);
    if (line.empty()) {
      continue;
    }

    auto version = ParseIndexVersion(line);
    if (!version.ok()) {
      return version.status();
    }

    krate.versions.push_back(*std::move(version));
  }

  if (krate.versions.empty()) {
    return absl::InvalidArgumentError("parse error: index file has no entries");
  }

  return krate;
}

}  // namespace crates
