#pragma once
#include <optional>
#include <string>
#include <variant>

#include <regionmerge/rule.hpp>

namespace regionmerge {

struct CmdMerge {
  std::string target_world;
  std::string source_world;
  MergeRule rule = MergeRule::NewestWins;
  bool assume_yes = false;
  bool dry_run = false;
  bool verbose = false;
};

struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdMerge, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
};

ParseResult parse_cli(int argc, char** argv);

} // namespace regionmerge
