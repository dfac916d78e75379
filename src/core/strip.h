#pragma once

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "color/color_input.h"
#include "color/color_resolver.h"
#include "status.h"
#include "types.h"

namespace neostrip {
namespace core {

// Addressable state of a chain of RGB pixels, stored as a flat byte buffer in
// pixel-major R,G,B order: [R0, G0, B0, R1, G1, B1, ...].
//
// The pixel count is fixed at construction and the buffer starts all zero.
// Channel values outside 0..255 are stored as their low byte.
//
// Not thread-safe; callers serialize access to one instance.
class Strip {
 public:
  // Larger requested counts are clamped to this.
  static constexpr size_t kMaxPixelCount = 0xFFFF;

  // resolver is not owned and must outlive the strip.
  explicit Strip(size_t pixel_count, const ColorResolver& resolver = ColorResolver::standard());

  size_t pixel_count() const { return pixel_count_; }

  // Fails with IndexOutOfRange or UnresolvableColor; the buffer is unchanged
  // on failure.
  Status set_pixel_color(int32_t index, const ColorInput& color);

  // *out is written only on success.
  Status get_pixel_color(int32_t index, Rgb* out) const;

  // Sets every pixel to black.
  void off();

  // Resolves color once, then fills every pixel. No pixel changes on failure.
  Status on(const ColorInput& color);

  // Live view of the strip state, buffer_size() bytes long (null when the
  // strip is empty). Valid until the strip is destroyed; it reflects later
  // writes.
  const uint8_t* buffer() const { return buffer_.empty() ? nullptr : buffer_.data(); }
  size_t buffer_size() const { return buffer_.size(); }

 private:
  static constexpr size_t clamp_pixel_count(size_t pixel_count) {
    return pixel_count > kMaxPixelCount ? kMaxPixelCount : pixel_count;
  }

  bool is_valid_index(int32_t index) const {
    return index >= 0 && static_cast<size_t>(index) < pixel_count_;
  }

  void write_pixel(size_t index, const Channels& c);

  size_t pixel_count_ = 0;
  const ColorResolver* resolver_ = nullptr;
  std::vector<uint8_t> buffer_;
};

}  // namespace core
}  // namespace neostrip
