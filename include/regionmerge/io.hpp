#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace regionmerge {
namespace io {
  // All functions throw IoError.
  std::string read_file(const std::filesystem::path& path);

  // Writes <path>.tmp, fsyncs it and renames it over path.
  void write_file_atomic(const std::filesystem::path& path, std::string_view bytes);

  // Byte-for-byte copy; the destination is re-read and its XXH64 compared
  // with the source's.
  void copy_file_verified(const std::filesystem::path& from,
                          const std::filesystem::path& to);

  uint64_t xxh64(std::string_view bytes);
}
} // namespace regionmerge
