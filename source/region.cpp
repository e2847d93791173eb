#include <regionmerge/region.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace regionmerge {

static void check_index(uint16_t index) {
  if (index >= kSlotCount)
    throw std::out_of_range("slot index out of range: " + std::to_string(index));
}

bool Region::contains(uint16_t index) const {
  return index < kSlotCount && slots_[index].has_value();
}

const Chunk* Region::find(uint16_t index) const {
  if (!contains(index)) return nullptr;
  return &*slots_[index];
}

Chunk* Region::find(uint16_t index) {
  if (!contains(index)) return nullptr;
  return &*slots_[index];
}

void Region::put(uint16_t index, Chunk chunk) {
  check_index(index);
  if (!slots_[index]) order_.push_back(index);
  slots_[index] = std::move(chunk);
}

} // namespace regionmerge
