#pragma once

#include <stddef.h>
#include <stdint.h>

namespace neostrip {
namespace platform {

struct PerfStats {
  uint32_t flush_ms;
  uint32_t frame_ms;
};

class ILedOutput {
 public:
  virtual ~ILedOutput() = default;
  virtual bool begin() = 0;

  // rgb is a pixel-major R,G,B byte buffer of len bytes (see core::Strip).
  // Returns false without touching the hardware when len does not describe
  // whole pixels or exceeds the attached pixel count.
  virtual bool show(const uint8_t* rgb, size_t len, PerfStats* stats) = 0;
};

}  // namespace platform
}  // namespace neostrip
