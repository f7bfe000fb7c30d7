// SPDX-License-Identifier: MIT
#ifndef CRATES_GIT_HH_
#define CRATES_GIT_HH_

#include <filesystem>
#include <string>
#include <vector>

#include "absl/status/statusor.h"

namespace crates {

struct GitResult {
  int exit_status = 0;
  std::string output;
};

// Runs `git --git-dir=<git_dir> args...` and captures its standard output.
// Standard error is passed through. A non-zero exit status is not an error
// here; what it means depends on the command.
absl::StatusOr<GitResult> RunGit(const std::filesystem::path& git_dir,
                                 const std::vector<std::string>& args);

}  // namespace crates

#endif  // CRATES_GIT_HH_
