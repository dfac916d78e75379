#pragma once

#include <stdint.h>

#include "../types.h"

namespace neostrip {
namespace core {

inline uint8_t clamp_channel(int32_t v) {
  if (v < 0) return 0;
  if (v > 255) return 255;
  return static_cast<uint8_t>(v);
}

// Low byte of v, matching an 8-bit store of an out-of-range value.
inline uint8_t truncate_channel(int32_t v) {
  return static_cast<uint8_t>(static_cast<uint32_t>(v) & 0xFFU);
}

inline uint8_t round_unit_to_u8(double unit) {
  if (unit <= 0.0) return 0;
  if (unit >= 1.0) return 255;
  return static_cast<uint8_t>(unit * 255.0 + 0.5);
}

// hue in degrees (any value, wrapped into [0, 360)), saturation and lightness
// in percent (clamped to [0, 100]).
Rgb hsl_to_rgb(double hue_deg, double saturation_pct, double lightness_pct);

}  // namespace core
}  // namespace neostrip
