// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include <frost/graphic/color.hpp>
#include <glm/glm.hpp>

namespace frost {

Color4f Color4fFromColor(Color color) {
  return Color4f{ColorGetR(color) / 255.f, ColorGetG(color) / 255.f,
                 ColorGetB(color) / 255.f, ColorGetA(color) / 255.f};
}

Color Color4fToColor(const Color4f& color) {
  auto c = glm::clamp(color, Color4f{0.f}, Color4f{1.f});
  auto to_byte = [](float v) {
    return static_cast<uint8_t>(v * 255.f + 0.5f);
  };
  return ColorSetARGB(to_byte(c.a), to_byte(c.r), to_byte(c.g), to_byte(c.b));
}

}  // namespace frost
