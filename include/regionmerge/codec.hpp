#pragma once
#include <string>
#include <string_view>

#include <regionmerge/errors.hpp>
#include <regionmerge/region.hpp>

namespace regionmerge {

// Parses the 8 KiB header (location + timestamp tables) and slices every live
// chunk's payload. Chunks are inserted in ascending slot order.
// Throws DecodeError.
Region decode_region(std::string_view bytes);

// Reassigns sector offsets back to back starting at sector 2, following the
// region's iteration order.
void compact_sectors(Region& region);

// Compacts the region, then serializes header and payloads. Unwritten bytes
// are zero. Throws EncodeError.
std::string encode_region(Region& region);

} // namespace regionmerge
