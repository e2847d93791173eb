#include <regionmerge/app.hpp>
#include <regionmerge/cli.hpp>
#include <regionmerge/finder.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#ifndef REGIONMERGE_VERSION
#define REGIONMERGE_VERSION "unknown"
#endif

namespace regionmerge {

static void print_help() {
  std::cout <<
      R"(worldmerge - merge the region files of one world into another

Usage:
  worldmerge --target_world <dir> --source_world <dir> [options]

Options:
  -r, --rule RULE      how overlapping chunks are resolved (default: last-modified)
                         last-modified  keep the chunk with the newer timestamp
                         always         source chunk always overwrites
                         never          target chunk is always kept
  --target_world DIR   world the chunks are merged into (modified in place)
  --source_world DIR   world the chunks are taken from (left unchanged)
  -y, --yes            do not ask before each dimension
  --dry-run            only print what would be copied and merged
  -v, --verbose        debug logging
  -h, --help
  --version
)";
}

bool confirm_from_stream(std::istream& in, std::ostream& out, const DimensionPlan& plan) {
  out << "Do you want to continue merging "
      << (plan.dimension.empty() ? std::string("overworld") : plan.dimension)
      << "? [Y/n]: " << std::flush;
  std::string line;
  if (!std::getline(in, line)) return false;

  line.erase(0, line.find_first_not_of(" \t\r"));
  line.erase(line.find_last_not_of(" \t\r") + 1);
  std::transform(line.begin(), line.end(), line.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return line == "y" || line == "yes";
}

static int run_merge(const CmdMerge& c) {
  if (c.verbose) spdlog::set_level(spdlog::level::debug);

  ConfirmFn confirm;
  if (c.assume_yes)
    confirm = [](const DimensionPlan&) { return true; };
  else
    confirm = [](const DimensionPlan& p) { return confirm_from_stream(std::cin, std::cout, p); };

  RegionFinder finder({c.target_world, c.source_world, c.dry_run}, std::move(confirm));
  const WorldReport w = finder.merge_world(c.rule);

  fmt::print("Done! {} copied, {} merged, {} failed\n", w.copied, w.merged, w.failed);
  return w.failed == 0 ? 0 : 1;
}

int App::run(int argc, char** argv) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }

  return std::visit(
      [&](auto&& c) -> int {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, CmdHelp>) {
          print_help();
          return 0;
        } else if constexpr (std::is_same_v<T, CmdVersion>) {
          std::cout << fmt::format("worldmerge {}\n", REGIONMERGE_VERSION);
          return 0;
        } else {
          return run_merge(c);
        }
      },
      *pr.cmd);
}

} // namespace regionmerge
