// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_GRAPHIC_COLOR_HPP
#define INCLUDE_FROST_GRAPHIC_COLOR_HPP

#include <cstdint>
#include <frost/geometry/point.hpp>
#include <frost/macros.hpp>

namespace frost {

/**
 * 32-bit ARGB color, unpremultiplied. Alpha is stored in the top byte.
 */
using Color = uint32_t;

/**
 * Float color in {r, g, b, a} order, each component in [0, 1].
 */
using Color4f = Vec4;

constexpr Color ColorSetARGB(uint8_t a, uint8_t r, uint8_t g, uint8_t b) {
  return (static_cast<uint32_t>(a) << 24) | (static_cast<uint32_t>(r) << 16) |
         (static_cast<uint32_t>(g) << 8) | static_cast<uint32_t>(b);
}

constexpr Color ColorSetRGB(uint8_t r, uint8_t g, uint8_t b) {
  return ColorSetARGB(0xFF, r, g, b);
}

constexpr uint8_t ColorGetA(Color color) { return (color >> 24) & 0xFF; }
constexpr uint8_t ColorGetR(Color color) { return (color >> 16) & 0xFF; }
constexpr uint8_t ColorGetG(Color color) { return (color >> 8) & 0xFF; }
constexpr uint8_t ColorGetB(Color color) { return color & 0xFF; }

constexpr Color ColorSetA(Color color, uint8_t a) {
  return (color & 0x00FFFFFF) | (static_cast<uint32_t>(a) << 24);
}

constexpr Color Color_TRANSPARENT = 0x00000000;
constexpr Color Color_BLACK = 0xFF000000;
constexpr Color Color_DKGRAY = 0xFF444444;
constexpr Color Color_GRAY = 0xFF888888;
constexpr Color Color_LTGRAY = 0xFFCCCCCC;
constexpr Color Color_WHITE = 0xFFFFFFFF;
constexpr Color Color_RED = 0xFFFF0000;
constexpr Color Color_GREEN = 0xFF00FF00;
constexpr Color Color_BLUE = 0xFF0000FF;

Color4f FROST_API Color4fFromColor(Color color);

Color FROST_API Color4fToColor(const Color4f& color);

}  // namespace frost

#endif  // INCLUDE_FROST_GRAPHIC_COLOR_HPP
