#include <regionmerge/merge.hpp>

namespace regionmerge {

MergeStats merge_regions(Region& base, const Region& incoming, MergeRule rule) {
  MergeStats st;
  incoming.for_each([&](uint16_t idx, const Chunk& candidate) {
    Chunk* current = base.find(idx);
    if (!current) {
      base.put(idx, candidate);
      ++st.added;
    } else if (permits(rule, *current, candidate)) {
      *current = candidate;
      ++st.replaced;
    } else {
      ++st.kept;
    }
  });
  return st;
}

} // namespace regionmerge
