#pragma once

#include <stdint.h>

#include <Adafruit_DotStar.h>

#include "core/strip_config.h"
#include "led_output.h"

namespace neostrip {
namespace platform {

class DotstarOutput final : public ILedOutput {
 public:
  explicit DotstarOutput(const core::StripConfig& config) : config_(config) {}
  ~DotstarOutput() override;

  DotstarOutput(const DotstarOutput&) = delete;
  DotstarOutput& operator=(const DotstarOutput&) = delete;

  bool begin() override;
  bool show(const uint8_t* rgb, size_t len, PerfStats* stats) override;

 private:
  core::StripConfig config_;
  Adafruit_DotStar* strip_ = nullptr;
};

}  // namespace platform
}  // namespace neostrip
