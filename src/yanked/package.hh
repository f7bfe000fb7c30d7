// SPDX-License-Identifier: MIT
#ifndef YANKED_PACKAGE_HH_
#define YANKED_PACKAGE_HH_

#include <ostream>
#include <string>
#include <tuple>

namespace yanked {

// A package as named by a lock file. The version is an opaque key: registries
// carry versions which aren't valid semver, so it is only ever compared for
// equality and ordered bytewise.
struct Package {
  std::string name;
  std::string version;

  bool operator==(const Package& other) const {
    return name == other.name && version == other.version;
  }

  bool operator<(const Package& other) const {
    return std::tie(name, version) < std::tie(other.name, other.version);
  }
};

inline std::ostream& operator<<(std::ostream& os, const Package& package) {
  return os << package.name << " " << package.version;
}

}  // namespace yanked

#endif  // YANKED_PACKAGE_HH_
