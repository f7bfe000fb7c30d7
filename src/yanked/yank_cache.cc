// SPDX-License-Identifier: MIT
#include "yanked/yank_cache.hh"

#include <utility>

namespace yanked {

namespace {

YankCache::Entry MakeEntry(crates::Index::KrateResult result) {
  if (!result.ok()) {
    return result.status();
  }

  if (!result->has_value()) {
    return std::nullopt;
  }

  YankCache::VersionYankMap versions;
  for (const auto& v : (*result)->versions) {
    versions.insert_or_assign(v.version, v.yanked);
  }

  return versions;
}

}  // namespace

const YankCache::Entry& YankCache::Insert(std::string name,
                                          crates::Index::KrateResult result) {
  return entries_
      .insert_or_assign(std::move(name), MakeEntry(std::move(result)))
      .first->second;
}

const YankCache::Entry* YankCache::Lookup(std::string_view name) const {
  auto iter = entries_.find(name);
  if (iter == entries_.end()) {
    return nullptr;
  }

  return &iter->second;
}

}  // namespace yanked
