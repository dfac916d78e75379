#include "dotstar_output.h"

#include <Arduino.h>

#include "core/types.h"

namespace neostrip {
namespace platform {

namespace {

uint8_t to_dotstar_order(core::ColorOrder order) {
  switch (order) {
    case core::ColorOrder::Rgb:
      return DOTSTAR_RGB;
    case core::ColorOrder::Rbg:
      return DOTSTAR_RBG;
    case core::ColorOrder::Grb:
      return DOTSTAR_GRB;
    case core::ColorOrder::Gbr:
      return DOTSTAR_GBR;
    case core::ColorOrder::Brg:
      return DOTSTAR_BRG;
    case core::ColorOrder::Bgr:
      return DOTSTAR_BGR;
  }
  return DOTSTAR_BRG;
}

}  // namespace

DotstarOutput::~DotstarOutput() { delete strip_; }

bool DotstarOutput::begin() {
  if (strip_ == nullptr) {
    strip_ = new Adafruit_DotStar(config_.pixel_count,
                                  config_.data_pin,
                                  config_.clock_pin,
                                  to_dotstar_order(config_.color_order));
  }
  if (strip_ == nullptr) {
    return false;
  }

  strip_->begin();
  strip_->setBrightness(config_.brightness);
  for (uint16_t p = 0; p < config_.pixel_count; ++p) {
    strip_->setPixelColor(p, 0, 0, 0);
  }
  strip_->show();
  return true;
}

bool DotstarOutput::show(const uint8_t* rgb, size_t len, PerfStats* stats) {
  if (strip_ == nullptr) {
    return false;
  }
  if (rgb == nullptr && len != 0) {
    return false;
  }
  if (len % core::kBytesPerPixel != 0) {
    return false;
  }
  const size_t pixels = len / core::kBytesPerPixel;
  if (pixels > config_.pixel_count) {
    return false;
  }

  const uint32_t start_ms = millis();
  for (uint16_t p = 0; p < config_.pixel_count; ++p) {
    if (p < pixels) {
      const size_t o = static_cast<size_t>(p) * core::kBytesPerPixel;
      strip_->setPixelColor(p, rgb[o], rgb[o + 1], rgb[o + 2]);
    } else {
      strip_->setPixelColor(p, 0, 0, 0);
    }
  }
  strip_->show();

  if (stats != nullptr) {
    stats->flush_ms = millis() - start_ms;
  }
  return true;
}

}  // namespace platform
}  // namespace neostrip
