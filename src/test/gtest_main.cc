#include <unistd.h>

#include <cstdlib>

#include "gtest/gtest.h"

int main(int argc, char** argv) {
  setenv("TZ", "UTC", 1);
  setenv("LC_TIME", "C", 1);

  // Index discovery reads these. Tests pass explicit locations instead.
  unsetenv("CARGO_HOME");
  unsetenv("CARGO_REGISTRIES_CRATES_IO_PROTOCOL");
  unsetenv("YANKED_DEBUG");

  // Some tests serve index files from loopback.
  unsetenv("http_proxy");
  unsetenv("HTTP_PROXY");
  unsetenv("all_proxy");
  unsetenv("ALL_PROXY");

  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
