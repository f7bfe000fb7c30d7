// SPDX-License-Identifier: MIT
#include <getopt.h>

#include <clocale>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"
#include "absl/time/time.h"
#include "crates/client.hh"
#include "crates/interrupt.hh"
#include "crates/location.hh"
#include "yanked/cached_index.hh"
#include "yanked/package.hh"

namespace {

constexpr absl::Duration kDefaultLockTimeout = absl::Seconds(30);

struct Flags {
  bool ParseFromArgv(int* argc, char*** argv);

  bool offline = false;
  bool quiet = false;
  absl::Duration lock_timeout = kDefaultLockTimeout;
  std::optional<absl::Duration> connect_timeout;
  std::string baseurl;
  std::string index_dir;
};

[[noreturn]] void usage() {
  fputs(
      "yanked [options] NAME@VERSION...\n"
      "\n"
      "Check whether crate versions were yanked from the crates.io index.\n"
      "\n"
      "  -h, --help               Show this help\n"
      "      --version            Show software version\n"
      "\n"
      "  -q, --quiet              Only print names of yanked crates\n"
      "      --offline            Don't touch the network\n"
      "      --lock-timeout=SECS  Wait at most SECS for the index lock\n"
      "                           (default 30, 0 to fail immediately)\n"
      "      --timeout=SECS       Connect timeout for index requests\n",
      stdout);
  exit(0);
}

[[noreturn]] void version() {
  std::cout << "yanked " << PROJECT_VERSION << "\n";
  exit(0);
}

bool ParseSeconds(std::string_view arg, absl::Duration* duration) {
  double seconds;
  if (!absl::SimpleAtod(arg, &seconds) || seconds < 0) {
    return false;
  }

  *duration = absl::Seconds(seconds);
  return true;
}

bool Flags::ParseFromArgv(int* argc, char*** argv) {
  enum {
    ARG_VERSION = 1000,
    ARG_OFFLINE,
    ARG_LOCK_TIMEOUT,
    ARG_TIMEOUT,
    ARG_BASEURL,
    ARG_INDEX_DIR,
  };

  static constexpr struct option opts[] = {
      // clang-format off
      { "help",            no_argument,       nullptr, 'h' },
      { "quiet",           no_argument,       nullptr, 'q' },
      { "offline",         no_argument,       nullptr, ARG_OFFLINE },
      { "lock-timeout",    required_argument, nullptr, ARG_LOCK_TIMEOUT },
      { "timeout",         required_argument, nullptr, ARG_TIMEOUT },
      { "version",         no_argument,       nullptr, ARG_VERSION },

      // These are "private", and intentionally not documented in the manual or
      // usage.
      { "baseurl",         required_argument, nullptr, ARG_BASEURL },
      { "index-dir",       required_argument, nullptr, ARG_INDEX_DIR },
      {},
      // clang-format on
  };

  int opt;
  while ((opt = getopt_long(*argc, *argv, "hq", opts, nullptr)) != -1) {
    std::string_view sv_optarg(optarg ? optarg : "");

    switch (opt) {
      case 'h':
        usage();
      case 'q':
        quiet = true;
        break;
      case ARG_OFFLINE:
        offline = true;
        break;
      case ARG_LOCK_TIMEOUT:
        if (!ParseSeconds(sv_optarg, &lock_timeout)) {
          std::cerr << "error: invalid arg to --lock-timeout: " << sv_optarg
                    << "\n";
          return false;
        }
        break;
      case ARG_TIMEOUT: {
        absl::Duration timeout;
        if (!ParseSeconds(sv_optarg, &timeout) ||
            timeout == absl::ZeroDuration()) {
          std::cerr << "error: invalid arg to --timeout: " << sv_optarg
                    << "\n";
          return false;
        }
        connect_timeout = timeout;
        break;
      }
      case ARG_BASEURL:
        baseurl = optarg;
        break;
      case ARG_INDEX_DIR:
        index_dir = optarg;
        break;
      case ARG_VERSION:
        version();
        break;
      default:
        return false;
    }
  }

  *argc -= optind - 1;
  *argv += optind - 1;

  return true;
}

bool ParsePackage(std::string_view arg, yanked::Package* package) {
  std::vector<std::string_view> parts =
      absl::StrSplit(arg, absl::MaxSplits('@', 1));
  if (parts.size() != 2 || parts[0].empty() || parts[1].empty()) {
    return false;
  }

  package->name = std::string(parts[0]);
  package->version = std::string(parts[1]);
  return true;
}

absl::StatusOr<yanked::CachedIndex> OpenIndex(const Flags& flags) {
  crates::IndexLocation::Options location_options;
  if (!flags.index_dir.empty()) {
    location_options.set_index_dir(flags.index_dir);
  }

  auto location = crates::IndexLocation::CratesIo(location_options);
  if (!location.ok()) {
    return location.status();
  }

  if (flags.offline) {
    return yanked::CachedIndex::Open(*std::move(location), flags.lock_timeout);
  }

  crates::Client::Options client_options;
  if (!flags.baseurl.empty()) {
    client_options.set_baseurl(flags.baseurl);
  }
  if (flags.connect_timeout.has_value()) {
    client_options.set_connect_timeout(*flags.connect_timeout);
  }

  return yanked::CachedIndex::Fetch(*std::move(location),
                                    std::move(client_options),
                                    flags.lock_timeout);
}

}  // namespace

int main(int argc, char** argv) {
  Flags flags;
  if (!flags.ParseFromArgv(&argc, &argv)) {
    return 1;
  }

  if (argc < 2) {
    std::cerr << "error: no packages specified (use -h for help)\n";
    return 1;
  }

  std::vector<yanked::Package> packages;
  for (int i = 1; i < argc; ++i) {
    yanked::Package package;
    if (!ParsePackage(argv[i], &package)) {
      std::cerr << "error: expected NAME@VERSION, got: " << argv[i] << "\n";
      return 1;
    }
    packages.push_back(std::move(package));
  }

  std::setlocale(LC_ALL, "");
  crates::InstallInterruptHandler();

  auto index = OpenIndex(flags);
  if (!index.ok()) {
    std::cerr << "error: failed to open crates.io index: "
              << index.status().message() << "\n";
    return 1;
  }

  const auto results = index->FindYanked(packages);
  for (const auto& result : results) {
    if (!result.ok()) {
      std::cerr << "error: " << result.status().message() << "\n";
      continue;
    }

    const yanked::Package& package = **result;
    if (flags.quiet) {
      std::cout << package.name << "\n";
    } else {
      std::cout << package << " (yanked)\n";
    }
  }

  return results.empty() ? 0 : 1;
}

/* vim: set et ts=2 sw=2: */
