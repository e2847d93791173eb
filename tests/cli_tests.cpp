#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <regionmerge/app.hpp>
#include <regionmerge/cli.hpp>
#include <regionmerge/codec.hpp>
#include <regionmerge/io.hpp>

#include <filesystem>
#include <sstream>
#include <string>
#include <system_error>
#include <unistd.h>
#include <variant>
#include <vector>

using namespace regionmerge;
namespace fs = std::filesystem;

static ParseResult parse(std::vector<std::string> args) {
  args.insert(args.begin(), "worldmerge");
  std::vector<char*> argv;
  for (auto& a : args) argv.push_back(a.data());
  return parse_cli(static_cast<int>(argv.size()), argv.data());
}

TEST_CASE("merge command defaults to last-modified") {
  auto r = parse({"--target_world", "/w/a", "--source_world", "/w/b"});
  REQUIRE(r.error.empty());
  REQUIRE(r.cmd);
  auto* c = std::get_if<CmdMerge>(&*r.cmd);
  REQUIRE(c);
  REQUIRE(c->target_world == "/w/a");
  REQUIRE(c->source_world == "/w/b");
  REQUIRE(c->rule == MergeRule::NewestWins);
  REQUIRE_FALSE(c->assume_yes);
  REQUIRE_FALSE(c->dry_run);
  REQUIRE_FALSE(c->verbose);
}

TEST_CASE("rule, aliases and flags") {
  auto r = parse({"-r", "never", "--target-world", "t", "--source-world", "s", "-y",
                  "--dry-run", "-v"});
  REQUIRE(r.cmd);
  auto& c = std::get<CmdMerge>(*r.cmd);
  REQUIRE(c.rule == MergeRule::Never);
  REQUIRE(c.target_world == "t");
  REQUIRE(c.source_world == "s");
  REQUIRE(c.assume_yes);
  REQUIRE(c.dry_run);
  REQUIRE(c.verbose);

  auto r2 = parse({"--rule", "always", "--target_world", "t", "--source_world", "s"});
  REQUIRE(std::get<CmdMerge>(*r2.cmd).rule == MergeRule::Always);
}

TEST_CASE("invalid command lines report an error") {
  SECTION("unknown rule") {
    auto r = parse({"-r", "newest", "--target_world", "t", "--source_world", "s"});
    REQUIRE_FALSE(r.cmd);
    REQUIRE(r.error.find("unknown rule") != std::string::npos);
  }
  SECTION("missing world") {
    auto r = parse({"--target_world", "t"});
    REQUIRE_FALSE(r.cmd);
    REQUIRE_FALSE(r.error.empty());
  }
  SECTION("flag without value") {
    auto r = parse({"--source_world", "s", "--target_world"});
    REQUIRE_FALSE(r.cmd);
    REQUIRE_FALSE(r.error.empty());
  }
  SECTION("unknown flag") {
    auto r = parse({"--target_world", "t", "--source_world", "s", "--force"});
    REQUIRE_FALSE(r.cmd);
    REQUIRE(r.error == "unknown argument: --force");
  }
}

TEST_CASE("help and version") {
  REQUIRE(std::holds_alternative<CmdHelp>(*parse({}).cmd));
  REQUIRE(std::holds_alternative<CmdHelp>(*parse({"--help"}).cmd));
  REQUIRE(std::holds_alternative<CmdHelp>(*parse({"--target_world", "t", "-h"}).cmd));
  REQUIRE(std::holds_alternative<CmdVersion>(*parse({"--version"}).cmd));
}

TEST_CASE("confirmation prompt accepts only y/yes") {
  DimensionPlan plan;
  plan.dimension = "DIM1";

  auto ask = [&](const std::string& input, std::string* prompt = nullptr) {
    std::istringstream in(input);
    std::ostringstream out;
    bool ok = confirm_from_stream(in, out, plan);
    if (prompt) *prompt = out.str();
    return ok;
  };

  std::string prompt;
  REQUIRE(ask("y\n", &prompt));
  REQUIRE(prompt == "Do you want to continue merging DIM1? [Y/n]: ");
  REQUIRE(ask("YES\n"));
  REQUIRE(ask("  Y \r\n"));
  REQUIRE_FALSE(ask("n\n"));
  REQUIRE_FALSE(ask("\n"));
  REQUIRE_FALSE(ask(""));
  REQUIRE_FALSE(ask("yep\n"));
}

static int run_app(std::vector<std::string> args) {
  args.insert(args.begin(), "worldmerge");
  std::vector<char*> argv;
  for (auto& a : args) argv.push_back(a.data());
  return App{}.run(static_cast<int>(argv.size()), argv.data());
}

static fs::path mkd(const char* name) {
  auto d = fs::temp_directory_path() /
           (std::string("regionmerge_app_") + name + "_" + std::to_string(::getpid()));
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static void write_region(const fs::path& p, uint16_t slot, uint32_t ts, char fill) {
  Chunk c;
  c.timestamp = ts;
  c.sector_count = 1;
  c.payload.assign(kSectorSize, fill);
  Region r;
  r.put(slot, c);
  fs::create_directories(p.parent_path());
  io::write_file_atomic(p, encode_region(r));
}

TEST_CASE("exit code 2 for a bad command line, 0 for help") {
  REQUIRE(run_app({"-r", "newest", "--target_world", "t", "--source_world", "s"}) == 2);
  REQUIRE(run_app({"--target_world", "t"}) == 2);
  REQUIRE(run_app({"--help"}) == 0);
  REQUIRE(run_app({"--version"}) == 0);
}

TEST_CASE("exit code reflects per-file failures") {
  auto root = mkd("exit");
  auto target = (root / "target").string();
  auto source = (root / "source").string();

  write_region(fs::path(source) / "region" / "r.0.0.mca", 0, 10, 's');
  write_region(fs::path(source) / "DIM1" / "region" / "r.0.0.mca", 1, 10, 'e');

  SECTION("clean worlds merge with 0") {
    write_region(fs::path(target) / "region" / "r.0.0.mca", 3, 5, 't');

    REQUIRE(run_app({"--target_world", target, "--source_world", source, "--yes"}) == 0);
    REQUIRE(decode_region(io::read_file(fs::path(target) / "region" / "r.0.0.mca")).size() == 2);
    REQUIRE(fs::exists(fs::path(target) / "DIM1" / "region" / "r.0.0.mca"));
  }
  SECTION("a corrupt target region gives 1 and the rest still runs") {
    fs::create_directories(fs::path(target) / "region");
    io::write_file_atomic(fs::path(target) / "region" / "r.0.0.mca", "not a region");

    REQUIRE(run_app({"-r", "always", "--target_world", target, "--source_world", source,
                     "-y"}) == 1);
    REQUIRE(io::read_file(fs::path(target) / "region" / "r.0.0.mca") == "not a region");
    REQUIRE(fs::exists(fs::path(target) / "DIM1" / "region" / "r.0.0.mca"));
  }
  SECTION("dry run writes nothing and succeeds") {
    REQUIRE(run_app({"--target_world", target, "--source_world", source, "--dry-run"}) == 0);
    REQUIRE_FALSE(fs::exists(fs::path(target)));
  }

  std::error_code ec;
  fs::remove_all(root, ec);
}
