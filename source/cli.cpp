#include <regionmerge/cli.hpp>

#include <string_view>

namespace regionmerge {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

ParseResult parse_cli(int argc, char** argv) {
  ParseResult r{};
  if (argc < 2) {
    r.cmd = CmdHelp{};
    return r;
  }

  CmdMerge c{};
  for (int i = 1; i < argc; i++) {
    std::string_view a = argv[i];
    if (a == "-h" || a == "--help") {
      r.cmd = CmdHelp{};
      return r;
    }
    if (a == "--version") {
      r.cmd = CmdVersion{};
      return r;
    }

    if (a == "-r" || a == "--rule") {
      if (!has_arg(i, argc)) {
        r.error = std::string(a) + ": value required";
        return r;
      }
      std::string_view v = argv[++i];
      auto rule = parse_merge_rule(v);
      if (!rule) {
        r.error = "unknown rule: " + std::string(v) + " (expected last-modified, always or never)";
        return r;
      }
      c.rule = *rule;
    } else if (a == "--target_world" || a == "--target-world") {
      if (!has_arg(i, argc)) {
        r.error = std::string(a) + ": path required";
        return r;
      }
      c.target_world = argv[++i];
    } else if (a == "--source_world" || a == "--source-world") {
      if (!has_arg(i, argc)) {
        r.error = std::string(a) + ": path required";
        return r;
      }
      c.source_world = argv[++i];
    } else if (a == "-y" || a == "--yes") {
      c.assume_yes = true;
    } else if (a == "--dry-run") {
      c.dry_run = true;
    } else if (a == "-v" || a == "--verbose") {
      c.verbose = true;
    } else {
      r.error = "unknown argument: " + std::string(a);
      return r;
    }
  }

  if (c.target_world.empty() || c.source_world.empty()) {
    r.error = "--target_world and --source_world required";
    return r;
  }
  r.cmd = c;
  return r;
}

} // namespace regionmerge
