#pragma once

#include <stddef.h>
#include <stdint.h>

namespace neostrip {
namespace core {

// Hardware color order as understood by the LED driver.
enum class ColorOrder : uint8_t { Rgb, Rbg, Grb, Gbr, Brg, Bgr };

struct StripConfig {
  uint16_t pixel_count;
  uint8_t data_pin;
  uint8_t clock_pin;
  ColorOrder color_order;
  uint8_t brightness;          // hardware brightness, 0..255
  const char* default_color;   // applied at boot with Strip::on()
};

// Pin assignment (DATA, CLOCK): GPIO23, GPIO22.
constexpr StripConfig kStripConfig = {60, 23, 22, ColorOrder::Brg, 64, "black"};

constexpr uint32_t kSerialBaud = 115200;
constexpr size_t kConsoleLineCapacity = 96;
constexpr uint32_t kStatsIntervalMs = 5000;

static_assert(kStripConfig.pixel_count > 0, "strip must have >0 pixels");
static_assert(kConsoleLineCapacity >= 32, "console line buffer too small");

}  // namespace core
}  // namespace neostrip
