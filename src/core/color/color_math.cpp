#include "color_math.h"

#include <math.h>

namespace neostrip {
namespace core {

namespace {

double clamp_percent(double v) {
  if (v < 0.0) return 0.0;
  if (v > 100.0) return 100.0;
  return v;
}

double hue_to_unit(double t1, double t2, double t3) {
  if (t3 < 0.0) t3 += 1.0;
  if (t3 > 1.0) t3 -= 1.0;

  if (6.0 * t3 < 1.0) return t1 + (t2 - t1) * 6.0 * t3;
  if (2.0 * t3 < 1.0) return t2;
  if (3.0 * t3 < 2.0) return t1 + (t2 - t1) * (2.0 / 3.0 - t3) * 6.0;
  return t1;
}

}  // namespace

Rgb hsl_to_rgb(double hue_deg, double saturation_pct, double lightness_pct) {
  double h = fmod(hue_deg, 360.0);
  if (h < 0.0) h += 360.0;
  h /= 360.0;
  const double s = clamp_percent(saturation_pct) / 100.0;
  const double l = clamp_percent(lightness_pct) / 100.0;

  if (s == 0.0) {
    const uint8_t v = round_unit_to_u8(l);
    return Rgb{v, v, v};
  }

  const double t2 = l < 0.5 ? l * (1.0 + s) : l + s - l * s;
  const double t1 = 2.0 * l - t2;

  return Rgb{round_unit_to_u8(hue_to_unit(t1, t2, h + 1.0 / 3.0)),
             round_unit_to_u8(hue_to_unit(t1, t2, h)),
             round_unit_to_u8(hue_to_unit(t1, t2, h - 1.0 / 3.0))};
}

}  // namespace core
}  // namespace neostrip
