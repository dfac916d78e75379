#include <string.h>

#include <unity.h>

#include "core/color/named_colors.h"

using neostrip::core::NamedColor;
using neostrip::core::Rgb;
using neostrip::core::find_named_color;
using neostrip::core::named_color_count;
using neostrip::core::named_colors;

namespace {

void expect_rgb(uint8_t r, uint8_t g, uint8_t b, const Rgb& actual) {
  TEST_ASSERT_EQUAL_UINT8(r, actual.r);
  TEST_ASSERT_EQUAL_UINT8(g, actual.g);
  TEST_ASSERT_EQUAL_UINT8(b, actual.b);
}

}  // namespace

void test_named_colors_table_is_lowercase_and_unique() {
  const NamedColor* t = named_colors();
  const size_t n = named_color_count();
  TEST_ASSERT_EQUAL_UINT32(148, static_cast<uint32_t>(n));

  for (size_t i = 0; i < n; ++i) {
    for (const char* p = t[i].name; *p != '\0'; ++p) {
      TEST_ASSERT_TRUE(*p >= 'a' && *p <= 'z');
    }
    for (size_t j = i + 1; j < n; ++j) {
      TEST_ASSERT_TRUE(strcmp(t[i].name, t[j].name) != 0);
    }
  }
}

void test_named_colors_gray_aliases_agree() {
  Rgb gray = neostrip::core::kBlack;
  Rgb grey = neostrip::core::kBlack;
  TEST_ASSERT_TRUE(find_named_color("darkslategray", 13, &gray));
  TEST_ASSERT_TRUE(find_named_color("darkslategrey", 13, &grey));
  TEST_ASSERT_TRUE(gray == grey);
  expect_rgb(47, 79, 79, gray);
}

void test_named_colors_lookup_respects_length() {
  Rgb c{1, 1, 1};
  // Prefix of the buffer only.
  TEST_ASSERT_TRUE(find_named_color("redxyz", 3, &c));
  expect_rgb(255, 0, 0, c);

  c = Rgb{1, 1, 1};
  TEST_ASSERT_FALSE(find_named_color("re", 2, &c));
  TEST_ASSERT_FALSE(find_named_color("reddish", 7, &c));
  TEST_ASSERT_FALSE(find_named_color("red", 0, &c));
  TEST_ASSERT_FALSE(find_named_color(nullptr, 3, &c));
  expect_rgb(1, 1, 1, c);
}
