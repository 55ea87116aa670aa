// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef SRC_BLUR_OVERLAY_GRADIENT_CACHE_HPP
#define SRC_BLUR_OVERLAY_GRADIENT_CACHE_HPP

#include <cstdint>
#include <frost/blur/gradient_direction.hpp>
#include <frost/effect/shader.hpp>
#include <frost/graphic/color.hpp>
#include <memory>

namespace frost {

/**
 * Caches the color gradient drawn over the blur, in host local coordinates.
 */
class OverlayGradientCache {
 public:
  struct Key {
    int32_t width = 0;
    int32_t height = 0;
    Color start_color = Color_TRANSPARENT;
    Color end_color = Color_TRANSPARENT;
    GradientDirection direction = GradientDirection::kNone;

    bool operator==(const Key& other) const {
      return width == other.width && height == other.height &&
             start_color == other.start_color &&
             end_color == other.end_color && direction == other.direction;
    }
  };

  /**
   * A kNone direction produces a top to bottom gradient, an explicit gradient
   * request is never dropped.
   */
  std::shared_ptr<Shader> GetShader(int32_t width, int32_t height,
                                    Color start_color, Color end_color,
                                    GradientDirection direction);

  void Clear() {
    shader_.reset();
    key_ = Key{};
  }

  bool HasCachedShader() const { return shader_ != nullptr; }

 private:
  std::shared_ptr<Shader> shader_ = {};
  Key key_ = {};
};

}  // namespace frost

#endif  // SRC_BLUR_OVERLAY_GRADIENT_CACHE_HPP
