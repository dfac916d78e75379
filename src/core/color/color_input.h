#pragma once

#include <stdint.h>

#include "../types.h"

namespace neostrip {
namespace core {

enum class ColorInputKind : uint8_t { Channels, Text };

// Tagged color value accepted by Strip and ColorResolver.
// Text is not owned; it must stay valid for the duration of the call.
struct ColorInput {
  ColorInputKind kind;
  Channels channels;
  const char* text;

  constexpr ColorInput(int32_t r, int32_t g, int32_t b)
      : kind(ColorInputKind::Channels), channels{r, g, b}, text(nullptr) {}
  constexpr ColorInput(Rgb c)
      : kind(ColorInputKind::Channels), channels(to_channels(c)), text(nullptr) {}
  constexpr ColorInput(const char* t)
      : kind(ColorInputKind::Text), channels{0, 0, 0}, text(t) {}

  constexpr bool is_text() const { return kind == ColorInputKind::Text; }
};

}  // namespace core
}  // namespace neostrip
