#pragma once

#include <stddef.h>

#include "../types.h"

namespace neostrip {
namespace core {

struct NamedColor {
  const char* name;  // lowercase
  Rgb rgb;
};

// CSS color keywords (CSS Color Module Level 4), lowercase.
const NamedColor* named_colors();
size_t named_color_count();

// Case-insensitive lookup of a color keyword. `transparent` maps to black.
// Returns false and leaves *out untouched when the name is unknown.
bool find_named_color(const char* name, size_t len, Rgb* out);

}  // namespace core
}  // namespace neostrip
