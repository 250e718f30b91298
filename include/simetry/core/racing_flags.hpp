#pragma once

namespace simetry {

// RacingFlags: race-control flags currently shown to the driver.
// Default-constructed means no flag is active.
struct RacingFlags {
  bool green = false;
  bool yellow = false;
  bool blue = false;
  bool white = false;
  bool red = false;
  bool black = false;
  bool black_white = false;
  bool orange = false; // meatball / mechanical
  bool checkered = false;

  bool Any() const {
    return green || yellow || blue || white || red || black || black_white ||
           orange || checkered;
  }

  bool operator==(const RacingFlags &) const = default;
};

} // namespace simetry
