#pragma once

#include "../status.h"
#include "../types.h"
#include "color_input.h"
#include "color_string_parser.h"

namespace neostrip {
namespace core {

// Normalizes a ColorInput into a channel triple.
// Channel input passes through unchanged (no clamping); text goes to the
// string parser. The parser is not owned and must outlive the resolver.
class ColorResolver {
 public:
  explicit ColorResolver(const IColorStringParser* parser) : parser_(parser) {}

  Status resolve(const ColorInput& input, Channels* out) const;

  const IColorStringParser* parser() const { return parser_; }

  // Process-lifetime resolver backed by CssColorParser.
  static const ColorResolver& standard();

 private:
  const IColorStringParser* parser_ = nullptr;
};

}  // namespace core
}  // namespace neostrip
