// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef SRC_BLUR_SNAPSHOT_BLUR_CONTROLLER_HPP
#define SRC_BLUR_SNAPSHOT_BLUR_CONTROLLER_HPP

#include <frost/blur/blur_controller.hpp>
#include <frost/blur/pre_draw_dispatcher.hpp>
#include <memory>

#include "src/blur/blur_capture_canvas.hpp"
#include "src/blur/coordinate_tracker.hpp"
#include "src/blur/gradient_mask_cache.hpp"
#include "src/blur/overlay_compositor.hpp"
#include "src/blur/size_scaler.hpp"

namespace frost {

/**
 * CPU strategy. Before each frame the target is drawn into a downscaled
 * bitmap, the bitmap is blurred by the BlurAlgorithm, and Draw stretches the
 * result back over the host.
 *
 * The bitmap is updated from the pre-draw listener without invalidating the
 * host: a backend that already drew the bitmap keeps a reference to it and
 * shows the new pixels on its next pass.
 */
class SnapshotBlurController : public BlurController {
 public:
  enum class State {
    kUninitialized,
    kInitialized,
    kDestroyed,
  };

  explicit SnapshotBlurController(const BlurControllerDescriptor& desc);

  ~SnapshotBlurController() override;

  bool Draw(Canvas* canvas) override;

  void UpdateSize() override;

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
   * Capture and blur the target. Runs from the pre-draw listener.
   */
  void UpdateBlur();

  State GetState() const { return state_; }

  const std::shared_ptr<Bitmap>& GetSnapshot() const { return snapshot_; }

  float GetBlurRadius() const { return blur_radius_; }

  bool IsBlurEnabled() const { return blur_enabled_; }

  bool IsAutoUpdating() const;

  const CoordinateTracker& GetCoordinateTracker() const { return tracker_; }

  const OverlayCompositor& GetOverlayCompositor() const { return overlay_; }

  const GradientMaskCache& GetGradientMaskCache() const { return mask_cache_; }

 private:
  void Init(int32_t measured_width, int32_t measured_height);

  /**
   * Snapshot size with the per axis factors mapping it onto the current
   * host size. Returns false if the host or the snapshot is empty.
   */
  bool CurrentScale(ScaledSize* scale) const;

  void BlurAndSave();

  void ApplyFadeMask(const ScaledSize& scale);

  bool OnPreDraw();

 private:
  BlurHost* host_;
  BlurTarget* target_;
  std::shared_ptr<BlurAlgorithm> algorithm_;
  SizeScaler size_scaler_;
  CoordinateTracker tracker_;
  OverlayCompositor overlay_;
  GradientMaskCache mask_cache_ = {};

  std::shared_ptr<Drawable> frame_clear_drawable_ = {};
  std::shared_ptr<Bitmap> snapshot_ = {};
  std::unique_ptr<BlurCaptureCanvas> capture_canvas_ = {};

  float blur_radius_ = kDefaultBlurRadius;
  bool blur_enabled_ = true;
  bool auto_update_ = true;
  GradientDirection gradient_direction_ = GradientDirection::kNone;
  State state_ = State::kUninitialized;

  PreDrawSubscription target_window_subscription_ = {};
  PreDrawSubscription host_window_subscription_ = {};
};

}  // namespace frost

#endif  // SRC_BLUR_SNAPSHOT_BLUR_CONTROLLER_HPP
