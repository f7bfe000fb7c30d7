// SPDX-License-Identifier: MIT
#ifndef YANKED_TEST_TEMP_DIR_HH_
#define YANKED_TEST_TEMP_DIR_HH_

#include <stdlib.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

#include "gtest/gtest.h"

namespace yanked_test {

// A directory created fresh for one test and removed with everything in it
// when the test ends.
class TempDir {
 public:
  TempDir() {
    std::string tmpl =
        (std::filesystem::path(testing::TempDir()) / "yanked-test.XXXXXX")
            .string();
    if (mkdtemp(tmpl.data()) == nullptr) {
      ADD_FAILURE() << "failed to create temporary directory";
    }
    path_ = tmpl;
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

  // Writes a file beneath the directory, creating parent directories.
  void WriteFile(const std::filesystem::path& relpath,
                 std::string_view contents) const {
    const auto path = path_ / relpath;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream(path, std::ios::binary) << contents;
  }

 private:
  std::filesystem::path path_;
};

}  // namespace yanked_test

#endif  // YANKED_TEST_TEMP_DIR_HH_
