// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef SRC_BLUR_RENDER_NODE_BLUR_CONTROLLER_HPP
#define SRC_BLUR_RENDER_NODE_BLUR_CONTROLLER_HPP

#include <frost/blur/blur_controller.hpp>
#include <frost/blur/pre_draw_dispatcher.hpp>
#include <frost/render/render_node.hpp>
#include <memory>

#include "src/blur/blur_capture_canvas.hpp"
#include "src/blur/coordinate_tracker.hpp"
#include "src/blur/gradient_mask_cache.hpp"
#include "src/blur/overlay_compositor.hpp"
#include "src/utils/once.hpp"

namespace frost {

/**
 * GPU strategy. The blur node records a reference to the target node and
 * carries a blur RenderEffect, so the backend blurs the live target output at
 * full resolution and nothing is copied back to the CPU.
 *
 * The blur node is sized like the target and translated by the host offset,
 * which makes the part of the target behind the host land on the host
 * origin.
 */
class RenderNodeBlurController : public BlurController {
 public:
  explicit RenderNodeBlurController(const BlurControllerDescriptor& desc);

  ~RenderNodeBlurController() override;

  bool Draw(Canvas* canvas) override;

  /**
   * The blur node follows the target size on every draw, nothing to do.
   */
  void UpdateSize() override {}

  void Destroy() override;

  BlurController* SetBlurEnabled(bool enabled) override;

  BlurController* SetBlurAutoUpdate(bool enabled) override;

  BlurController* SetFrameClearDrawable(
      std::shared_ptr<Drawable> drawable) override;

  BlurController* SetBlurRadius(float radius) override;

  BlurController* SetOverlayColor(Color color) override;

  BlurController* SetBlurGradient(GradientDirection direction) override;

  BlurController* SetOverlayGradientColor(
      Color start_color, Color end_color,
      GradientDirection direction) override;

  /**
   * Counter rotate the blur node when the host itself is rotated, so the
   * content behind the host stays upright.
   */
  void UpdateRotation(float degrees);

  /**
   * Counter scale the blur node when the host itself is scaled. 0 is
   * ignored.
   */
  void UpdateScaleX(float scale_x);
  void UpdateScaleY(float scale_y);

  RenderNode* GetBlurNode() { return &blur_node_; }
  const RenderNode* GetBlurNode() const { return &blur_node_; }

  float GetBlurRadius() const { return blur_radius_; }

  bool IsBlurEnabled() const { return blur_enabled_; }

  bool IsAutoUpdating() const { return subscription_.IsActive(); }

  bool IsDestroyed() const { return destroyed_; }

  const CoordinateTracker& GetCoordinateTracker() const { return tracker_; }

  const OverlayCompositor& GetOverlayCompositor() const { return overlay_; }

  const GradientMaskCache& GetGradientMaskCache() const { return mask_cache_; }

  /**
   * Last bitmap the software path blurred, null until a software draw.
   */
  const std::shared_ptr<Bitmap>& GetSoftwareSnapshot() const {
    return software_snapshot_;
  }

 private:
  void HardwareDraw(Canvas* canvas);

  void SoftwareDraw(Canvas* canvas);

  void RecordBlurNode();

  void UpdateNodeProperties();

  void ApplyBlur();

  BlurAlgorithm* GetFallbackAlgorithm();

  bool OnPreDraw();

 private:
  BlurHost* host_;
  BlurTarget* target_;
  float scale_factor_;
  RenderNode blur_node_;
  CoordinateTracker tracker_;
  OverlayCompositor overlay_;
  GradientMaskCache mask_cache_ = {};

  std::shared_ptr<Drawable> frame_clear_drawable_ = {};
  float blur_radius_ = kDefaultBlurRadius;
  bool blur_enabled_ = true;
  bool destroyed_ = false;
  bool reapply_effect_on_transform_change_;
  GradientDirection gradient_direction_ = GradientDirection::kNone;

  BlurAlgorithmFactory fallback_factory_;
  std::shared_ptr<BlurAlgorithm> fallback_algorithm_ = {};
  bool fallback_requested_ = false;
  Once warn_no_fallback_;
  std::shared_ptr<Bitmap> software_snapshot_ = {};
  std::unique_ptr<BlurCaptureCanvas> software_canvas_ = {};

  PreDrawSubscription subscription_ = {};
};

}  // namespace frost

#endif  // SRC_BLUR_RENDER_NODE_BLUR_CONTROLLER_HPP
