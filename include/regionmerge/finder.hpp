#pragma once
#include <array>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <regionmerge/merge.hpp>
#include <regionmerge/rule.hpp>

namespace regionmerge {

inline constexpr std::string_view kRegionDirName = "region";
inline constexpr std::string_view kRegionSuffix  = ".mca";

// Overworld, End, Nether; processed in this order.
inline constexpr std::array<std::string_view, 3> kDimensions = {"", "DIM1", "DIM-1"};

struct FilePair {
  std::filesystem::path from; // source world
  std::filesystem::path to;   // target world
};

struct FilePlan {
  std::vector<FilePair> copy;  // only in source
  std::vector<FilePair> merge; // in both worlds
};

struct DimensionPlan {
  std::string dimension;
  std::filesystem::path target_dir;
  FilePlan files;
};

// Asked once per dimension with a non-empty plan. false skips the dimension.
using ConfirmFn = std::function<bool(const DimensionPlan&)>;

struct DimensionReport {
  std::string dimension;
  bool prompted = false;
  bool confirmed = false;
  std::size_t planned_copy = 0;
  std::size_t planned_merge = 0;
  std::size_t copied = 0;
  std::size_t merged = 0;
  std::size_t failed = 0;
  MergeStats chunks;
};

struct WorldReport {
  std::vector<DimensionReport> dimensions;
  std::size_t copied = 0;
  std::size_t merged = 0;
  std::size_t failed = 0;
};

struct FinderOptions {
  std::filesystem::path target_world; // modified in place
  std::filesystem::path source_world; // read only
  bool dry_run = false;
};

class RegionFinder {
public:
  RegionFinder(FinderOptions opts, ConfirmFn confirm);

  static std::filesystem::path region_dir(const std::filesystem::path& world,
                                          std::string_view dimension);

  // file name -> path of every non-empty *.mca below <world>/<dimension>/region.
  // A missing or unreadable directory gives an empty map.
  static std::map<std::string, std::filesystem::path>
  discover(const std::filesystem::path& world, std::string_view dimension);

  static FilePlan pair_files(const std::map<std::string, std::filesystem::path>& target,
                             const std::map<std::string, std::filesystem::path>& source,
                             const std::filesystem::path& target_dir);

  DimensionPlan plan_dimension(std::string_view dimension) const;
  DimensionReport merge_dimension(std::string_view dimension, MergeRule rule);
  WorldReport merge_world(MergeRule rule);

private:
  void print_plan(const DimensionPlan& plan) const;
  void copy_files(const DimensionPlan& plan, DimensionReport& rep);
  void merge_files(const DimensionPlan& plan, MergeRule rule, DimensionReport& rep);

  FinderOptions opts_;
  ConfirmFn confirm_;
};

std::string dimension_label(std::string_view dimension);

} // namespace regionmerge
