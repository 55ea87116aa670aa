// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_GEOMETRY_POINT_HPP
#define INCLUDE_FROST_GEOMETRY_POINT_HPP

#include <cstdint>
#include <glm/glm.hpp>

namespace frost {

using Vec2 = glm::vec2;
using Vec4 = glm::vec4;

/**
 * Integer point in screen space. Used for on-screen locations reported by the
 * host, which are always whole pixels.
 */
struct IPoint {
  int32_t x = 0;
  int32_t y = 0;

  constexpr IPoint() = default;
  constexpr IPoint(int32_t x, int32_t y) : x(x), y(y) {}

  constexpr bool operator==(const IPoint& other) const {
    return x == other.x && y == other.y;
  }

  constexpr bool operator!=(const IPoint& other) const {
    return !(*this == other);
  }

  constexpr IPoint operator-(const IPoint& other) const {
    return IPoint{x - other.x, y - other.y};
  }

  constexpr IPoint operator+(const IPoint& other) const {
    return IPoint{x + other.x, y + other.y};
  }
};

struct ISize {
  int32_t width = 0;
  int32_t height = 0;

  constexpr bool IsEmpty() const { return width <= 0 || height <= 0; }

  constexpr bool operator==(const ISize& other) const {
    return width == other.width && height == other.height;
  }

  constexpr bool operator!=(const ISize& other) const {
    return !(*this == other);
  }
};

}  // namespace frost

#endif  // INCLUDE_FROST_GEOMETRY_POINT_HPP
