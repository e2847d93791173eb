#pragma once
#include <cstddef>

#include <regionmerge/region.hpp>
#include <regionmerge/rule.hpp>

namespace regionmerge {

struct MergeStats {
  std::size_t added = 0;    // slot was only in incoming
  std::size_t replaced = 0; // rule let incoming overwrite base
  std::size_t kept = 0;     // rule kept base
};

// Applies incoming on top of base. New slots are appended after base's own
// slots in incoming's order; replaced slots keep their position in base.
MergeStats merge_regions(Region& base, const Region& incoming, MergeRule rule);

} // namespace regionmerge
