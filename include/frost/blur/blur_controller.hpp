// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_BLUR_BLUR_CONTROLLER_HPP
#define INCLUDE_FROST_BLUR_BLUR_CONTROLLER_HPP

#include <frost/blur/blur_algorithm.hpp>
#include <frost/blur/blur_region.hpp>
#include <frost/blur/gradient_direction.hpp>
#include <frost/blur/noise_overlay.hpp>
#include <frost/graphic/color.hpp>
#include <frost/macros.hpp>
#include <frost/render/canvas.hpp>
#include <frost/render/drawable.hpp>
#include <functional>
#include <memory>

namespace frost {

constexpr float kDefaultBlurRadius = 16.f;

/**
 * Default downscale factor of the snapshot strategy. The render node strategy
 * multiplies the blur radius by it instead.
 */
constexpr float kDefaultScaleFactor = 4.f;

using BlurAlgorithmFactory = std::function<std::shared_ptr<BlurAlgorithm>()>;

struct BlurControllerDescriptor {
  /**
   * Surface displaying the blur. Not owned, must outlive the controller.
   */
  BlurHost* host = nullptr;

  /**
   * Content being blurred. Not owned, must outlive the controller.
   */
  BlurTarget* target = nullptr;

  Color overlay_color = Color_TRANSPARENT;

  /**
   * Must be >= 1. Values below 1 are clamped to 1.
   */
  float scale_factor = kDefaultScaleFactor;

  /**
   * Required by the snapshot strategy, ignored by the render node strategy.
   */
  std::shared_ptr<BlurAlgorithm> blur_algorithm = {};

  /**
   * Used by the render node strategy when it has to draw into a software
   * canvas. Called lazily, at most once per controller.
   */
  BlurAlgorithmFactory fallback_algorithm_factory = {};

  /**
   * Null disables the noise layer.
   */
  std::shared_ptr<NoiseOverlay> noise = {};

  /**
   * Some rendering backends do not re-render a node after a transform only
   * change. Setting this makes the render node strategy re-attach its effect
   * on every node property update.
   */
  bool reapply_effect_on_transform_change = false;
};

/**
 * Drives the blur of one host surface. The host calls Draw from its own draw
 * pass once per frame.
 *
 * Every setter returns this controller so calls can be chained. Setting a
 * value equal to the current one does nothing.
 */
class FROST_API BlurController {
 public:
  virtual ~BlurController() = default;

  /**
   * Create the strategy matching the host capabilities. The render node
   * strategy is used when the host supports render effects and the target
   * exposes a render node, the snapshot strategy otherwise.
   *
   * @return null if host or target is missing, or if the snapshot strategy is
   *         required but no blur algorithm was given.
   */
  static std::unique_ptr<BlurController> Make(
      const BlurControllerDescriptor& desc);

  /**
   * Draw the blurred content into canvas.
   *
   * @return true if this controller drew anything, false lets the caller fall
   *         back to its default drawing.
   */
  virtual bool Draw(Canvas* canvas) = 0;

  /**
   * Re-derive internal buffers from the measured size of the host. Call after
   * the host was measured with a new size.
   */
  virtual void UpdateSize() = 0;

  /**
   * Release owned resources and stop listening for pre-draw events. Safe to
   * call more than once. The controller draws nothing afterwards.
   */
  virtual void Destroy() = 0;

  virtual BlurController* SetBlurEnabled(bool enabled) = 0;

  /**
   * Start or stop refreshing the blur before each frame.
   */
  virtual BlurController* SetBlurAutoUpdate(bool enabled) = 0;

  /**
   * Drawable filling the capture before the target draws, for targets
   * without an opaque background. Null clears the capture to transparent.
   */
  virtual BlurController* SetFrameClearDrawable(
      std::shared_ptr<Drawable> drawable) = 0;

  /**
   * Negative values are clamped to 0.
   */
  virtual BlurController* SetBlurRadius(float radius) = 0;

  /**
   * Solid color drawn over the blur. Clears any overlay gradient.
   */
  virtual BlurController* SetOverlayColor(Color color) = 0;

  /**
   * Fade the blur out along direction. kNone makes the blur uniform.
   */
  virtual BlurController* SetBlurGradient(GradientDirection direction) = 0;

  /**
   * Gradient drawn over the blur instead of the overlay color while either
   * color is not transparent. kNone runs top to bottom.
   */
  virtual BlurController* SetOverlayGradientColor(
      Color start_color, Color end_color, GradientDirection direction) = 0;
};

}  // namespace frost

#endif  // INCLUDE_FROST_BLUR_BLUR_CONTROLLER_HPP
