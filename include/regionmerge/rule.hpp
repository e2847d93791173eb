#pragma once
#include <optional>
#include <string_view>

#include <regionmerge/region.hpp>

namespace regionmerge {

// Decides whether a chunk from the source world may overwrite the chunk
// already stored at the same slot of the target world.
enum class MergeRule {
  Always,     // source always wins
  Never,      // target always wins; unique source chunks are still added
  NewestWins, // source wins only with a strictly newer timestamp
};

bool permits(MergeRule rule, const Chunk& current, const Chunk& candidate);

// CLI names: "always", "never", "last-modified".
std::optional<MergeRule> parse_merge_rule(std::string_view name);
std::string_view to_string(MergeRule rule);

} // namespace regionmerge
