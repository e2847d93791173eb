#pragma once
#include <stdexcept>
#include <string>

namespace regionmerge {

struct RegionError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Region bytes too short or inconsistent with the header layout.
struct DecodeError : RegionError {
  using RegionError::RegionError;
};

// A chunk that cannot be written without truncation (e.g. > 255 sectors).
struct EncodeError : RegionError {
  using RegionError::RegionError;
};

struct IoError : RegionError {
  using RegionError::RegionError;
};

} // namespace regionmerge
