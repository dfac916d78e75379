#include "strip.h"

#include "color/color_math.h"

namespace neostrip {
namespace core {

constexpr size_t Strip::kMaxPixelCount;

Strip::Strip(size_t pixel_count, const ColorResolver& resolver)
    : pixel_count_(clamp_pixel_count(pixel_count)),
      resolver_(&resolver),
      buffer_(pixel_count_ * kBytesPerPixel, 0) {}

Status Strip::set_pixel_color(int32_t index, const ColorInput& color) {
  if (!is_valid_index(index)) {
    return Status::IndexOutOfRange;
  }

  Channels c{0, 0, 0};
  const Status s = resolver_->resolve(color, &c);
  if (!ok(s)) {
    return s;
  }

  write_pixel(static_cast<size_t>(index), c);
  return Status::Ok;
}

Status Strip::get_pixel_color(int32_t index, Rgb* out) const {
  if (out == nullptr) {
    return Status::InvalidArgument;
  }
  if (!is_valid_index(index)) {
    return Status::IndexOutOfRange;
  }

  const size_t offset = static_cast<size_t>(index) * kBytesPerPixel;
  *out = Rgb{buffer_[offset], buffer_[offset + 1], buffer_[offset + 2]};
  return Status::Ok;
}

void Strip::off() {
  const Channels black = to_channels(kBlack);
  for (size_t i = 0; i < pixel_count_; ++i) {
    write_pixel(i, black);
  }
}

Status Strip::on(const ColorInput& color) {
  Channels c{0, 0, 0};
  const Status s = resolver_->resolve(color, &c);
  if (!ok(s)) {
    return s;
  }

  for (size_t i = 0; i < pixel_count_; ++i) {
    write_pixel(i, c);
  }
  return Status::Ok;
}

void Strip::write_pixel(size_t index, const Channels& c) {
  const size_t offset = index * kBytesPerPixel;
  buffer_[offset] = truncate_channel(c.r);
  buffer_[offset + 1] = truncate_channel(c.g);
  buffer_[offset + 2] = truncate_channel(c.b);
}

}  // namespace core
}  // namespace neostrip
