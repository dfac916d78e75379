#pragma once

#include <stdint.h>

namespace neostrip {
namespace core {

enum class Status : uint8_t {
  Ok,
  UnresolvableColor,
  IndexOutOfRange,
  InvalidArgument,
};

constexpr bool ok(Status s) { return s == Status::Ok; }

// Stable lowercase token, used in serial logs.
inline const char* status_name(Status s) {
  switch (s) {
    case Status::Ok:
      return "ok";
    case Status::UnresolvableColor:
      return "unresolvable_color";
    case Status::IndexOutOfRange:
      return "index_out_of_range";
    case Status::InvalidArgument:
      return "invalid_argument";
  }
  return "unknown";
}

}  // namespace core
}  // namespace neostrip
