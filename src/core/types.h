#pragma once

#include <stddef.h>
#include <stdint.h>

namespace neostrip {
namespace core {

constexpr size_t kBytesPerPixel = 3;

struct Rgb {
  uint8_t r;
  uint8_t g;
  uint8_t b;

  constexpr bool operator==(const Rgb& other) const {
    return r == other.r && g == other.g && b == other.b;
  }
  constexpr bool operator!=(const Rgb& other) const { return !(*this == other); }
};

constexpr Rgb kBlack{0, 0, 0};

// Unvalidated channel triple. Values outside 0..255 are truncated to the low
// byte when written into a strip buffer.
struct Channels {
  int32_t r;
  int32_t g;
  int32_t b;

  constexpr bool operator==(const Channels& other) const {
    return r == other.r && g == other.g && b == other.b;
  }
};

constexpr Channels to_channels(Rgb c) { return Channels{c.r, c.g, c.b}; }

}  // namespace core
}  // namespace neostrip
