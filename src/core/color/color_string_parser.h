#pragma once

#include "../types.h"

namespace neostrip {
namespace core {

// Capability that turns a color string into an RGB triple.
// Implementations must leave *out untouched when they return false.
class IColorStringParser {
 public:
  virtual ~IColorStringParser() = default;
  virtual bool parse(const char* text, Rgb* out) const = 0;
};

}  // namespace core
}  // namespace neostrip
