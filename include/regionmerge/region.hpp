#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace regionmerge {

inline constexpr std::size_t kSectorSize     = 4096;
inline constexpr std::size_t kSlotCount      = 1024;
inline constexpr uint32_t    kHeaderSectors  = 2;
inline constexpr std::size_t kHeaderBytes    = kHeaderSectors * kSectorSize;
inline constexpr uint32_t    kMaxSectorCount = 255;

// One chunk slot. payload is opaque and always sector_count * kSectorSize long.
struct Chunk {
  uint32_t timestamp = 0;
  uint32_t sector_offset = 0;
  uint8_t sector_count = 0;
  std::string payload;
};

// Slot index -> Chunk, iterated in insertion order.
// The order decides the sector layout chosen by compact_sectors().
class Region {
public:
  bool contains(uint16_t index) const;
  const Chunk* find(uint16_t index) const;
  Chunk* find(uint16_t index);

  // Appends a new index at the end; an existing index keeps its position.
  void put(uint16_t index, Chunk chunk);

  const std::vector<uint16_t>& order() const { return order_; }
  std::size_t size() const { return order_.size(); }
  bool empty() const { return order_.empty(); }

  template <class Fn> void for_each(Fn&& fn) const {
    for (uint16_t idx : order_) fn(idx, *slots_[idx]);
  }
  template <class Fn> void for_each(Fn&& fn) {
    for (uint16_t idx : order_) fn(idx, *slots_[idx]);
  }

private:
  std::array<std::optional<Chunk>, kSlotCount> slots_{};
  std::vector<uint16_t> order_;
};

} // namespace regionmerge
