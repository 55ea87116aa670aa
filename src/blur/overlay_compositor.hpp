// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef SRC_BLUR_OVERLAY_COMPOSITOR_HPP
#define SRC_BLUR_OVERLAY_COMPOSITOR_HPP

#include <cstdint>
#include <frost/blur/gradient_direction.hpp>
#include <frost/blur/noise_overlay.hpp>
#include <frost/graphic/color.hpp>
#include <frost/graphic/paint.hpp>
#include <frost/render/canvas.hpp>
#include <memory>

#include "src/blur/overlay_gradient_cache.hpp"

namespace frost {

/**
 * Everything drawn on top of the blurred content: the noise layer, then
 * either the overlay gradient or the solid overlay color.
 */
class OverlayCompositor {
 public:
  OverlayCompositor(Color overlay_color, std::shared_ptr<NoiseOverlay> noise);

  /**
   * Also resets the gradient colors to transparent so the solid color wins.
   *
   * @return true if anything changed
   */
  bool SetOverlayColor(Color color);

  /**
   * @return true if anything changed
   */
  bool SetOverlayGradientColor(Color start_color, Color end_color,
                               GradientDirection direction);

  Color GetOverlayColor() const { return overlay_color_; }
  Color GetStartColor() const { return start_color_; }
  Color GetEndColor() const { return end_color_; }
  GradientDirection GetGradientDirection() const { return direction_; }

  bool HasOverlayGradient() const {
    return start_color_ != Color_TRANSPARENT || end_color_ != Color_TRANSPARENT;
  }

  /**
   * Noise, then overlay gradient if set, otherwise the solid overlay color.
   * Drawn over (0, 0, width, height) in the current canvas space.
   */
  void Composite(Canvas* canvas, int32_t width, int32_t height);

  /**
   * Noise and the solid overlay color only.
   */
  void CompositeSolid(Canvas* canvas, int32_t width, int32_t height);

  const OverlayGradientCache& GetGradientCache() const {
    return gradient_cache_;
  }

 private:
  void ApplyNoise(Canvas* canvas, int32_t width, int32_t height);

 private:
  Color overlay_color_;
  Color start_color_ = Color_TRANSPARENT;
  Color end_color_ = Color_TRANSPARENT;
  GradientDirection direction_ = GradientDirection::kNone;
  std::shared_ptr<NoiseOverlay> noise_;
  OverlayGradientCache gradient_cache_ = {};
  Paint paint_ = {};
};

}  // namespace frost

#endif  // SRC_BLUR_OVERLAY_COMPOSITOR_HPP
