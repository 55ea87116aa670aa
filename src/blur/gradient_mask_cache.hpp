// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef SRC_BLUR_GRADIENT_MASK_CACHE_HPP
#define SRC_BLUR_GRADIENT_MASK_CACHE_HPP

#include <cstdint>
#include <frost/blur/gradient_direction.hpp>
#include <frost/effect/shader.hpp>
#include <memory>

namespace frost {

/**
 * Caches the alpha mask that fades the blur out along a direction.
 *
 * The mask is opaque where the blur is kept and transparent where the sharp
 * content shows through. It lives in the coordinate space of the blur node,
 * which is the target space, so it is offset by the host position inside the
 * target.
 */
class GradientMaskCache {
 public:
  struct Key {
    int32_t width = 0;
    int32_t height = 0;
    int32_t left = 0;
    int32_t top = 0;
    GradientDirection direction = GradientDirection::kNone;

    bool operator==(const Key& other) const {
      return width == other.width && height == other.height &&
             left == other.left && top == other.top &&
             direction == other.direction;
    }
  };

  /**
   * @return null if direction is kNone. The cache is cleared in that case.
   */
  std::shared_ptr<Shader> GetShader(int32_t width, int32_t height,
                                    int32_t left, int32_t top,
                                    GradientDirection direction);

  void Clear() {
    shader_.reset();
    key_ = Key{};
  }

  bool HasCachedShader() const { return shader_ != nullptr; }

 private:
  static std::shared_ptr<Shader> MakeMask(const Key& key);

 private:
  std::shared_ptr<Shader> shader_ = {};
  Key key_ = {};
};

}  // namespace frost

#endif  // SRC_BLUR_GRADIENT_MASK_CACHE_HPP
