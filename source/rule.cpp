#include <regionmerge/rule.hpp>

namespace regionmerge {

bool permits(MergeRule rule, const Chunk& current, const Chunk& candidate) {
  switch (rule) {
  case MergeRule::Always:
    return true;
  case MergeRule::Never:
    return false;
  case MergeRule::NewestWins:
    return candidate.timestamp > current.timestamp;
  }
  return false;
}

std::optional<MergeRule> parse_merge_rule(std::string_view name) {
  if (name == "always") return MergeRule::Always;
  if (name == "never") return MergeRule::Never;
  if (name == "last-modified") return MergeRule::NewestWins;
  return std::nullopt;
}

std::string_view to_string(MergeRule rule) {
  switch (rule) {
  case MergeRule::Always:
    return "always";
  case MergeRule::Never:
    return "never";
  case MergeRule::NewestWins:
    return "last-modified";
  }
  return "unknown";
}

} // namespace regionmerge
