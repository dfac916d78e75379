#include "css_color_parser.h"

#include <ctype.h>
#include <math.h>
#include <string.h>

#include "color_math.h"
#include "named_colors.h"

namespace neostrip {
namespace core {

namespace {

constexpr double kMaxNumber = 1.0e6;

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool starts_with_ignore_case(const char* s, size_t len, const char* lower) {
  const size_t n = strlen(lower);
  if (len < n) return false;
  for (size_t i = 0; i < n; ++i) {
    if (tolower(static_cast<unsigned char>(s[i])) != lower[i]) return false;
  }
  return true;
}

// Forward-only reader over a bounded character range.
class Cursor {
 public:
  Cursor(const char* s, size_t len) : p_(s), end_(s + len) {}

  bool at_end() const { return p_ == end_; }

  bool skip_ws() {
    const char* start = p_;
    while (p_ != end_ && is_space(*p_)) ++p_;
    return p_ != start;
  }

  bool consume(char c) {
    if (p_ != end_ && *p_ == c) {
      ++p_;
      return true;
    }
    return false;
  }

  bool consume_ignore_case(const char* lower) {
    const size_t avail = static_cast<size_t>(end_ - p_);
    if (!starts_with_ignore_case(p_, avail, lower)) return false;
    p_ += strlen(lower);
    return true;
  }

  // Whitespace and/or a single comma between two arguments.
  bool separator() {
    const bool ws = skip_ws();
    const bool comma = consume(',');
    skip_ws();
    return ws || comma;
  }

  // [+-]? (digits [. digits*] | . digits). Magnitude saturates at kMaxNumber.
  bool read_number(double* out, bool* is_integer) {
    const char* start = p_;
    double sign = 1.0;
    if (p_ != end_ && (*p_ == '+' || *p_ == '-')) {
      if (*p_ == '-') sign = -1.0;
      ++p_;
    }

    double value = 0.0;
    bool any_digit = false;
    while (p_ != end_ && isdigit(static_cast<unsigned char>(*p_))) {
      if (value < kMaxNumber) value = value * 10.0 + (*p_ - '0');
      any_digit = true;
      ++p_;
    }

    bool fraction = false;
    if (p_ != end_ && *p_ == '.') {
      fraction = true;
      ++p_;
      double scale = 0.1;
      while (p_ != end_ && isdigit(static_cast<unsigned char>(*p_))) {
        value += (*p_ - '0') * scale;
        scale *= 0.1;
        any_digit = true;
        ++p_;
      }
    }

    if (!any_digit) {
      p_ = start;
      return false;
    }
    if (value > kMaxNumber) value = kMaxNumber;
    *out = sign * value;
    if (is_integer != nullptr) *is_integer = !fraction;
    return true;
  }

  // Optional alpha argument, then the closing paren at end of input.
  bool close_with_optional_alpha() {
    skip_ws();
    if (consume(',') || consume('/')) {
      skip_ws();
      double alpha = 0.0;
      if (!read_number(&alpha, nullptr)) return false;
      (void)consume('%');
      skip_ws();
    }
    return consume(')') && at_end();
  }

 private:
  const char* p_;
  const char* end_;
};

int32_t saturate_i32(double v) {
  if (v < -kMaxNumber) return static_cast<int32_t>(-kMaxNumber);
  if (v > kMaxNumber) return static_cast<int32_t>(kMaxNumber);
  return static_cast<int32_t>(v);
}

bool parse_hex(const char* s, size_t len, Rgb* out) {
  if (s == nullptr || out == nullptr || len < 1 || s[0] != '#') {
    return false;
  }
  const size_t digits = len - 1;
  if (digits != 3 && digits != 4 && digits != 6 && digits != 8) {
    return false;
  }

  int v[8] = {};
  for (size_t i = 0; i < digits; ++i) {
    v[i] = hex_digit(s[i + 1]);
    if (v[i] < 0) return false;
  }

  if (digits <= 4) {
    // Short form: each nibble is repeated, 0xF -> 0xFF.
    *out = Rgb{static_cast<uint8_t>(v[0] * 17), static_cast<uint8_t>(v[1] * 17),
               static_cast<uint8_t>(v[2] * 17)};
  } else {
    *out = Rgb{static_cast<uint8_t>(v[0] * 16 + v[1]), static_cast<uint8_t>(v[2] * 16 + v[3]),
               static_cast<uint8_t>(v[4] * 16 + v[5])};
  }
  return true;
}

bool parse_rgb_function(const char* s, size_t len, Rgb* out) {
  if (s == nullptr || out == nullptr) {
    return false;
  }
  Cursor c(s, len);
  if (!c.consume_ignore_case("rgb")) return false;
  (void)c.consume_ignore_case("a");
  if (!c.consume('(')) return false;
  c.skip_ws();

  double v[3] = {};
  bool percent[3] = {};
  for (int i = 0; i < 3; ++i) {
    bool is_integer = false;
    if (!c.read_number(&v[i], &is_integer)) return false;
    percent[i] = c.consume('%');
    if (!percent[i] && !is_integer) return false;
    if (i < 2 && !c.separator()) return false;
  }
  if (percent[0] != percent[1] || percent[1] != percent[2]) {
    return false;
  }
  if (!c.close_with_optional_alpha()) {
    return false;
  }

  uint8_t ch[3] = {};
  for (int i = 0; i < 3; ++i) {
    const double raw = percent[i] ? floor(v[i] * 2.55 + 0.5) : v[i];
    ch[i] = clamp_channel(saturate_i32(raw));
  }
  *out = Rgb{ch[0], ch[1], ch[2]};
  return true;
}

bool parse_hsl_function(const char* s, size_t len, Rgb* out) {
  if (s == nullptr || out == nullptr) {
    return false;
  }
  Cursor c(s, len);
  if (!c.consume_ignore_case("hsl")) return false;
  (void)c.consume_ignore_case("a");
  if (!c.consume('(')) return false;
  c.skip_ws();

  double hue = 0.0;
  double sat = 0.0;
  double light = 0.0;
  if (!c.read_number(&hue, nullptr)) return false;
  (void)c.consume_ignore_case("deg");
  if (!c.separator()) return false;
  if (!c.read_number(&sat, nullptr) || !c.consume('%')) return false;
  if (!c.separator()) return false;
  if (!c.read_number(&light, nullptr) || !c.consume('%')) return false;
  if (!c.close_with_optional_alpha()) return false;

  *out = hsl_to_rgb(hue, sat, light);
  return true;
}

}  // namespace

bool CssColorParser::parse(const char* text, Rgb* out) const {
  if (text == nullptr || out == nullptr) {
    return false;
  }

  const char* s = text;
  size_t len = strlen(text);
  while (len > 0 && is_space(*s)) {
    ++s;
    --len;
  }
  while (len > 0 && is_space(s[len - 1])) {
    --len;
  }
  if (len == 0) {
    return false;
  }

  if (s[0] == '#') {
    return parse_hex(s, len, out);
  }
  if (starts_with_ignore_case(s, len, "rgb")) {
    return parse_rgb_function(s, len, out);
  }
  if (starts_with_ignore_case(s, len, "hsl")) {
    return parse_hsl_function(s, len, out);
  }
  return find_named_color(s, len, out);
}

}  // namespace core
}  // namespace neostrip
