#include <regionmerge/codec.hpp>
#include <regionmerge/finder.hpp>
#include <regionmerge/io.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <exception>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace regionmerge {

std::string dimension_label(std::string_view dimension) {
  return (fs::path(std::string(dimension)) / std::string(kRegionDirName)).string();
}

RegionFinder::RegionFinder(FinderOptions opts, ConfirmFn confirm)
    : opts_(std::move(opts)), confirm_(std::move(confirm)) {}

fs::path RegionFinder::region_dir(const fs::path& world, std::string_view dimension) {
  fs::path p = world;
  if (!dimension.empty()) p /= std::string(dimension);
  return p / std::string(kRegionDirName);
}

static bool is_region_name(const std::string& name) {
  return name.size() > kRegionSuffix.size() && name.ends_with(kRegionSuffix);
}

std::map<std::string, fs::path> RegionFinder::discover(const fs::path& world,
                                                       std::string_view dimension) {
  std::map<std::string, fs::path> out;
  const fs::path dir = region_dir(world, dimension);

  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return out;

  std::vector<fs::path> found;
  fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code e2;
    if (!it->is_regular_file(e2)) continue;
    if (!is_region_name(it->path().filename().string())) continue;
    const auto sz = it->file_size(e2);
    if (e2 || sz == 0) continue;
    found.push_back(it->path());
  }
  if (ec) spdlog::warn("listing {} stopped early: {}", dir.string(), ec.message());

  std::sort(found.begin(), found.end());
  for (auto& p : found) {
    auto [pos, inserted] = out.emplace(p.filename().string(), p);
    if (!inserted) {
      spdlog::warn("duplicate region file {} ignored, using {}", p.string(),
                   pos->second.string());
    }
  }
  return out;
}

FilePlan RegionFinder::pair_files(const std::map<std::string, fs::path>& target,
                                  const std::map<std::string, fs::path>& source,
                                  const fs::path& target_dir) {
  FilePlan plan;
  for (const auto& [name, from] : source) {
    auto t = target.find(name);
    if (t != target.end())
      plan.merge.push_back({from, t->second});
    else
      plan.copy.push_back({from, target_dir / name});
  }
  return plan;
}

DimensionPlan RegionFinder::plan_dimension(std::string_view dimension) const {
  DimensionPlan plan;
  plan.dimension  = std::string(dimension);
  plan.target_dir = region_dir(opts_.target_world, dimension);
  plan.files = pair_files(discover(opts_.target_world, dimension),
                          discover(opts_.source_world, dimension), plan.target_dir);
  return plan;
}

void RegionFinder::print_plan(const DimensionPlan& plan) const {
  const auto label = dimension_label(plan.dimension);
  fmt::print("Region files in {} to copy: {}\n", label, plan.files.copy.size());
  for (const auto& p : plan.files.copy) fmt::print("\tCopy: {}\n", p.from.string());
  fmt::print("Region files in {} to merge: {}\n", label, plan.files.merge.size());
  for (const auto& p : plan.files.merge) fmt::print("\tMerge: {}\n", p.to.string());
  std::fflush(stdout);
}

void RegionFinder::copy_files(const DimensionPlan& plan, DimensionReport& rep) {
  if (plan.files.copy.empty()) return;

  std::error_code ec;
  fs::create_directories(plan.target_dir, ec);
  if (ec) spdlog::warn("cannot create {}: {}", plan.target_dir.string(), ec.message());

  for (const auto& p : plan.files.copy) {
    try {
      io::copy_file_verified(p.from, p.to);
      ++rep.copied;
    } catch (const std::exception& e) {
      spdlog::error("Error copying {} to {}: {}", p.from.string(), p.to.string(), e.what());
      ++rep.failed;
    }
  }
}

void RegionFinder::merge_files(const DimensionPlan& plan, MergeRule rule,
                               DimensionReport& rep) {
  for (const auto& p : plan.files.merge) {
    try {
      Region base = decode_region(io::read_file(p.to));
      const Region incoming = decode_region(io::read_file(p.from));

      const MergeStats st = merge_regions(base, incoming, rule);
      io::write_file_atomic(p.to, encode_region(base));

      spdlog::debug("merged {}: +{} added, {} replaced, {} kept", p.to.string(),
                    st.added, st.replaced, st.kept);
      rep.chunks.added    += st.added;
      rep.chunks.replaced += st.replaced;
      rep.chunks.kept     += st.kept;
      ++rep.merged;
    } catch (const std::exception& e) {
      spdlog::error("Error merging {} into {}: {}", p.from.string(), p.to.string(), e.what());
      ++rep.failed;
    }
  }
}

DimensionReport RegionFinder::merge_dimension(std::string_view dimension, MergeRule rule) {
  DimensionReport rep;
  rep.dimension = std::string(dimension);

  const DimensionPlan plan = plan_dimension(dimension);
  rep.planned_copy  = plan.files.copy.size();
  rep.planned_merge = plan.files.merge.size();
  print_plan(plan);

  if (plan.files.copy.empty() && plan.files.merge.empty()) return rep;
  if (opts_.dry_run) {
    spdlog::info("dry run: {} left untouched", dimension_label(dimension));
    return rep;
  }

  rep.prompted = true;
  rep.confirmed = confirm_ && confirm_(plan);
  if (!rep.confirmed) {
    spdlog::info("skipping {}", dimension_label(dimension));
    return rep;
  }

  copy_files(plan, rep);
  merge_files(plan, rule, rep);
  spdlog::info("{}: {} copied, {} merged, {} failed (chunks: {} added, {} replaced, {} kept)",
               dimension_label(dimension), rep.copied, rep.merged, rep.failed,
               rep.chunks.added, rep.chunks.replaced, rep.chunks.kept);
  return rep;
}

WorldReport RegionFinder::merge_world(MergeRule rule) {
  spdlog::info("merging {} into {} (rule: {})", opts_.source_world.string(),
               opts_.target_world.string(), to_string(rule));
  WorldReport w;
  for (auto dim : kDimensions) {
    auto rep = merge_dimension(dim, rule);
    w.copied += rep.copied;
    w.merged += rep.merged;
    w.failed += rep.failed;
    w.dimensions.push_back(std::move(rep));
  }
  return w;
}

} // namespace regionmerge
