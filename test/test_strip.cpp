#include <stdint.h>

#include <vector>

#include <unity.h>

#include "core/strip.h"

using neostrip::core::Channels;
using neostrip::core::ColorInput;
using neostrip::core::ColorResolver;
using neostrip::core::IColorStringParser;
using neostrip::core::Rgb;
using neostrip::core::Status;
using neostrip::core::Strip;

namespace {

void expect_status(Status expected, Status actual) {
  TEST_ASSERT_EQUAL_STRING(neostrip::core::status_name(expected),
                           neostrip::core::status_name(actual));
}

void expect_rgb(uint8_t r, uint8_t g, uint8_t b, const Rgb& actual) {
  TEST_ASSERT_EQUAL_UINT8(r, actual.r);
  TEST_ASSERT_EQUAL_UINT8(g, actual.g);
  TEST_ASSERT_EQUAL_UINT8(b, actual.b);
}

class CountingParser final : public IColorStringParser {
 public:
  mutable uint32_t calls = 0;

  bool parse(const char* text, Rgb* out) const override {
    ++calls;
    if (text == nullptr || out == nullptr) return false;
    if (text[0] == 'x') return false;
    *out = Rgb{7, 8, 9};
    return true;
  }
};

std::vector<uint8_t> snapshot(const Strip& s) {
  if (s.buffer() == nullptr) return std::vector<uint8_t>();
  return std::vector<uint8_t>(s.buffer(), s.buffer() + s.buffer_size());
}

}  // namespace

void test_strip_construct_zero_fills_buffer() {
  const size_t counts[] = {1, 2, 3, 17, 300};
  for (size_t n : counts) {
    Strip s(n);
    TEST_ASSERT_EQUAL_UINT32(static_cast<uint32_t>(n), static_cast<uint32_t>(s.pixel_count()));
    TEST_ASSERT_EQUAL_UINT32(static_cast<uint32_t>(n * 3), static_cast<uint32_t>(s.buffer_size()));
    TEST_ASSERT_NOT_NULL(s.buffer());
    for (size_t i = 0; i < s.buffer_size(); ++i) {
      TEST_ASSERT_EQUAL_UINT8(0, s.buffer()[i]);
    }
  }
}

void test_strip_zero_pixels_is_legal() {
  Strip s(0);
  TEST_ASSERT_EQUAL_UINT32(0, static_cast<uint32_t>(s.pixel_count()));
  TEST_ASSERT_EQUAL_UINT32(0, static_cast<uint32_t>(s.buffer_size()));
  TEST_ASSERT_NULL(s.buffer());

  s.off();
  expect_status(Status::Ok, s.on("red"));
  expect_status(Status::IndexOutOfRange, s.set_pixel_color(0, "red"));
  Rgb c = neostrip::core::kBlack;
  expect_status(Status::IndexOutOfRange, s.get_pixel_color(0, &c));
  TEST_ASSERT_EQUAL_UINT32(0, static_cast<uint32_t>(s.buffer_size()));
}

void test_strip_set_get_round_trip() {
  Strip s(4);
  const Rgb colors[] = {{0, 0, 0}, {255, 255, 255}, {1, 2, 3}, {200, 100, 50}};
  for (int32_t i = 0; i < 4; ++i) {
    expect_status(Status::Ok, s.set_pixel_color(i, colors[i]));
  }
  for (int32_t i = 0; i < 4; ++i) {
    Rgb c = neostrip::core::kBlack;
    expect_status(Status::Ok, s.get_pixel_color(i, &c));
    TEST_ASSERT_TRUE(c == colors[i]);
  }
}

void test_strip_buffer_layout_is_pixel_major_rgb() {
  Strip s(2);
  expect_status(Status::Ok, s.set_pixel_color(0, "blue"));
  expect_status(Status::Ok, s.set_pixel_color(1, ColorInput(1, 2, 3)));

  const uint8_t expected[] = {0, 0, 255, 1, 2, 3};
  TEST_ASSERT_EQUAL_UINT32(6, static_cast<uint32_t>(s.buffer_size()));
  TEST_ASSERT_EQUAL_UINT8_ARRAY(expected, s.buffer(), 6);
}

void test_strip_out_of_range_index_fails_without_mutation() {
  Strip s(3);
  expect_status(Status::Ok, s.on(ColorInput(9, 9, 9)));
  const std::vector<uint8_t> before = snapshot(s);

  expect_status(Status::IndexOutOfRange, s.set_pixel_color(-1, "red"));
  expect_status(Status::IndexOutOfRange, s.set_pixel_color(3, "red"));
  expect_status(Status::IndexOutOfRange, s.set_pixel_color(INT32_MAX, "red"));
  expect_status(Status::IndexOutOfRange, s.set_pixel_color(INT32_MIN, ColorInput(1, 1, 1)));

  Rgb c{42, 42, 42};
  expect_status(Status::IndexOutOfRange, s.get_pixel_color(-1, &c));
  expect_status(Status::IndexOutOfRange, s.get_pixel_color(3, &c));
  expect_rgb(42, 42, 42, c);  // untouched on failure

  TEST_ASSERT_TRUE(before == snapshot(s));
}

void test_strip_get_pixel_color_rejects_null_output() {
  Strip s(1);
  expect_status(Status::InvalidArgument, s.get_pixel_color(0, nullptr));
}

void test_strip_unresolvable_color_leaves_buffer_unchanged() {
  Strip s(2);
  expect_status(Status::Ok, s.set_pixel_color(0, "#102030"));
  const std::vector<uint8_t> before = snapshot(s);

  expect_status(Status::UnresolvableColor, s.set_pixel_color(0, "not-a-color"));
  expect_status(Status::UnresolvableColor, s.set_pixel_color(1, static_cast<const char*>(nullptr)));
  TEST_ASSERT_TRUE(before == snapshot(s));
}

void test_strip_on_fills_every_pixel() {
  Strip s(3);
  expect_status(Status::Ok, s.on(ColorInput(10, 20, 30)));
  const uint8_t expected[] = {10, 20, 30, 10, 20, 30, 10, 20, 30};
  TEST_ASSERT_EQUAL_UINT8_ARRAY(expected, s.buffer(), 9);

  expect_status(Status::Ok, s.on("lime"));
  for (int32_t i = 0; i < 3; ++i) {
    Rgb c = neostrip::core::kBlack;
    expect_status(Status::Ok, s.get_pixel_color(i, &c));
    expect_rgb(0, 255, 0, c);
  }
}

void test_strip_on_failure_is_atomic() {
  Strip s(4);
  expect_status(Status::Ok, s.set_pixel_color(2, "orange"));
  const std::vector<uint8_t> before = snapshot(s);

  expect_status(Status::UnresolvableColor, s.on("rgb(1,2)"));
  TEST_ASSERT_TRUE(before == snapshot(s));
}

void test_strip_on_resolves_once() {
  CountingParser parser;
  ColorResolver resolver(&parser);
  Strip s(5, resolver);

  expect_status(Status::Ok, s.on("anything"));
  TEST_ASSERT_EQUAL_UINT32(1, parser.calls);
  for (size_t i = 0; i < s.buffer_size(); i += 3) {
    TEST_ASSERT_EQUAL_UINT8(7, s.buffer()[i]);
    TEST_ASSERT_EQUAL_UINT8(8, s.buffer()[i + 1]);
    TEST_ASSERT_EQUAL_UINT8(9, s.buffer()[i + 2]);
  }

  expect_status(Status::UnresolvableColor, s.on("x"));
  TEST_ASSERT_EQUAL_UINT32(2, parser.calls);
  TEST_ASSERT_EQUAL_UINT8(7, s.buffer()[0]);
}

void test_strip_off_matches_per_pixel_black() {
  Strip a(6);
  Strip b(6);
  expect_status(Status::Ok, a.on("white"));
  expect_status(Status::Ok, b.on("white"));

  a.off();
  for (int32_t i = 0; i < 6; ++i) {
    expect_status(Status::Ok, b.set_pixel_color(i, ColorInput(0, 0, 0)));
  }
  TEST_ASSERT_TRUE(snapshot(a) == snapshot(b));
  for (size_t i = 0; i < a.buffer_size(); ++i) {
    TEST_ASSERT_EQUAL_UINT8(0, a.buffer()[i]);
  }

  // Idempotent.
  a.off();
  TEST_ASSERT_TRUE(snapshot(a) == snapshot(b));
}

void test_strip_truncates_out_of_range_channels() {
  Strip s(2);
  expect_status(Status::Ok, s.set_pixel_color(0, ColorInput(256, 300, -1)));
  expect_status(Status::Ok, s.set_pixel_color(1, ColorInput(511, -256, 65535)));

  const uint8_t expected[] = {0, 44, 255, 255, 0, 255};
  TEST_ASSERT_EQUAL_UINT8_ARRAY(expected, s.buffer(), 6);
}

void test_strip_buffer_is_live_view() {
  Strip s(2);
  const uint8_t* view = s.buffer();
  expect_status(Status::Ok, s.set_pixel_color(1, "red"));
  TEST_ASSERT_EQUAL_PTR(view, s.buffer());
  TEST_ASSERT_EQUAL_UINT8(255, view[3]);
  TEST_ASSERT_EQUAL_UINT8(0, view[4]);
}

void test_strip_pixel_count_is_clamped_with_buffer() {
  Strip huge(SIZE_MAX / 3 + 1);
  TEST_ASSERT_EQUAL_UINT32(static_cast<uint32_t>(Strip::kMaxPixelCount),
                           static_cast<uint32_t>(huge.pixel_count()));
  TEST_ASSERT_EQUAL_UINT32(static_cast<uint32_t>(huge.pixel_count() * 3),
                           static_cast<uint32_t>(huge.buffer_size()));

  expect_status(Status::Ok, huge.set_pixel_color(0, ColorInput(1, 2, 3)));
  const int32_t last = static_cast<int32_t>(Strip::kMaxPixelCount - 1);
  expect_status(Status::Ok, huge.set_pixel_color(last, ColorInput(4, 5, 6)));
  expect_status(Status::IndexOutOfRange,
                huge.set_pixel_color(static_cast<int32_t>(Strip::kMaxPixelCount), "red"));

  const uint8_t* buf = huge.buffer();
  TEST_ASSERT_EQUAL_UINT8(1, buf[0]);
  TEST_ASSERT_EQUAL_UINT8(6, buf[huge.buffer_size() - 1]);
}

void test_strip_max_pixel_count_is_kept() {
  Strip s(Strip::kMaxPixelCount);
  TEST_ASSERT_EQUAL_UINT32(static_cast<uint32_t>(Strip::kMaxPixelCount),
                           static_cast<uint32_t>(s.pixel_count()));
  TEST_ASSERT_EQUAL_UINT32(static_cast<uint32_t>(Strip::kMaxPixelCount * 3),
                           static_cast<uint32_t>(s.buffer_size()));

  Strip over(Strip::kMaxPixelCount + 1);
  TEST_ASSERT_EQUAL_UINT32(static_cast<uint32_t>(Strip::kMaxPixelCount),
                           static_cast<uint32_t>(over.pixel_count()));
}
