#include "color_resolver.h"

#include "css_color_parser.h"

namespace neostrip {
namespace core {

Status ColorResolver::resolve(const ColorInput& input, Channels* out) const {
  if (out == nullptr) {
    return Status::InvalidArgument;
  }

  switch (input.kind) {
    case ColorInputKind::Channels:
      *out = input.channels;
      return Status::Ok;
    case ColorInputKind::Text: {
      if (parser_ == nullptr || input.text == nullptr) {
        return Status::UnresolvableColor;
      }
      Rgb rgb = kBlack;
      if (!parser_->parse(input.text, &rgb)) {
        return Status::UnresolvableColor;
      }
      *out = to_channels(rgb);
      return Status::Ok;
    }
  }
  return Status::UnresolvableColor;
}

const ColorResolver& ColorResolver::standard() {
  static const CssColorParser parser;
  static const ColorResolver resolver(&parser);
  return resolver;
}

}  // namespace core
}  // namespace neostrip
