#pragma once

#include "color_string_parser.h"

namespace neostrip {
namespace core {

// Built-in color-string grammar:
//   #rgb, #rgba, #rrggbb, #rrggbbaa
//   rgb(r, g, b) / rgba(r, g, b, a), integer channels clamped to 0..255
//   rgb(r%, g%, b%) / rgba(...), percentage channels
//   hsl(h, s%, l%) / hsla(...), hue in degrees with optional "deg"
//   CSS color keywords and "transparent"
// Separators may be commas or whitespace; alpha (after ',' or '/') is parsed
// and dropped. Keywords and function names are case-insensitive; surrounding
// whitespace is ignored.
class CssColorParser final : public IColorStringParser {
 public:
  bool parse(const char* text, Rgb* out) const override;
};

}  // namespace core
}  // namespace neostrip
