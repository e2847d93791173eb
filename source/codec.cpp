#include <regionmerge/codec.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <utility>

namespace regionmerge {

// Both header tables are 1024 big-endian 4-byte entries.
static constexpr std::size_t kEntrySize      = 4;
static constexpr std::size_t kLocationTable  = 0;
static constexpr std::size_t kTimestampTable = kSectorSize;

static inline uint32_t read_be(std::string_view b, std::size_t pos, std::size_t n) {
  uint32_t v = 0;
  for (std::size_t i = 0; i < n; ++i)
    v = (v << 8) | static_cast<unsigned char>(b[pos + i]);
  return v;
}

static inline void write_be(std::string& b, std::size_t pos, uint32_t v, std::size_t n) {
  for (std::size_t i = 0; i < n; ++i)
    b[pos + i] = static_cast<char>((v >> (8 * (n - 1 - i))) & 0xFF);
}

Region decode_region(std::string_view bytes) {
  if (bytes.size() < kHeaderBytes) {
    throw DecodeError(fmt::format("region too short: {} bytes, header needs {}",
                                  bytes.size(), kHeaderBytes));
  }

  // payload offsets are relative to the end of the header
  const std::string_view data = bytes.substr(kHeaderBytes);
  Region region;

  for (std::size_t k = 0; k < kSlotCount; ++k) {
    const std::size_t entry = k * kEntrySize;
    const uint32_t offset = read_be(bytes, kLocationTable + entry, 3);
    const uint32_t count  = static_cast<unsigned char>(bytes[kLocationTable + entry + 3]);
    if (count == 0) continue;

    if (offset < kHeaderSectors) {
      throw DecodeError(fmt::format("slot {}: sector offset {} points into the header", k, offset));
    }
    const std::size_t begin = static_cast<std::size_t>(offset - kHeaderSectors) * kSectorSize;
    const std::size_t len   = static_cast<std::size_t>(count) * kSectorSize;
    if (begin + len > data.size()) {
      throw DecodeError(fmt::format(
          "slot {}: sectors [{}, {}) exceed region size {} bytes", k, offset,
          offset + count, bytes.size()));
    }

    Chunk c;
    c.timestamp     = read_be(bytes, kTimestampTable + entry, 4);
    c.sector_offset = offset;
    c.sector_count  = static_cast<uint8_t>(count);
    c.payload.assign(data.substr(begin, len));
    region.put(static_cast<uint16_t>(k), std::move(c));
  }

  spdlog::debug("decoded region: {} bytes, {} chunks", bytes.size(), region.size());
  return region;
}

void compact_sectors(Region& region) {
  uint32_t next = kHeaderSectors;
  region.for_each([&](uint16_t, Chunk& c) {
    c.sector_offset = next;
    next += c.sector_count;
  });
}

static void check_chunk(uint16_t index, const Chunk& c) {
  if (c.sector_count == 0) {
    throw EncodeError(fmt::format("slot {}: sector count is zero", index));
  }
  if (c.payload.size() != static_cast<std::size_t>(c.sector_count) * kSectorSize) {
    throw EncodeError(fmt::format(
        "slot {}: payload is {} bytes, {} sectors need {} (max {} sectors per chunk)",
        index, c.payload.size(), c.sector_count,
        static_cast<std::size_t>(c.sector_count) * kSectorSize, kMaxSectorCount));
  }
}

std::string encode_region(Region& region) {
  region.for_each([](uint16_t idx, const Chunk& c) { check_chunk(idx, c); });
  compact_sectors(region);

  std::size_t max_extent = 0;
  region.for_each([&](uint16_t, const Chunk& c) {
    const std::size_t end =
        static_cast<std::size_t>(c.sector_offset + c.sector_count - kHeaderSectors) * kSectorSize;
    max_extent = std::max(max_extent, end);
  });

  std::string out(kHeaderBytes + max_extent, '\0');
  region.for_each([&](uint16_t idx, const Chunk& c) {
    const std::size_t entry = static_cast<std::size_t>(idx) * kEntrySize;
    write_be(out, kLocationTable + entry, c.sector_offset, 3);
    out[kLocationTable + entry + 3] = static_cast<char>(c.sector_count);
    write_be(out, kTimestampTable + entry, c.timestamp, 4);

    // absolute position; sector 2 lands right after the header
    std::memcpy(out.data() + static_cast<std::size_t>(c.sector_offset) * kSectorSize,
                c.payload.data(), c.payload.size());
  });

  spdlog::debug("encoded region: {} chunks, {} bytes", region.size(), out.size());
  return out;
}

} // namespace regionmerge
