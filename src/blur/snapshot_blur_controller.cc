// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include "src/blur/snapshot_blur_controller.hpp"

#include <utility>

#include "src/logging.hpp"

namespace frost {

SnapshotBlurController::SnapshotBlurController(
    const BlurControllerDescriptor& desc)
    : host_(desc.host),
      target_(desc.target),
      algorithm_(desc.blur_algorithm),
      size_scaler_(desc.scale_factor),
      tracker_(desc.host, desc.target),
      overlay_(desc.overlay_color, desc.noise) {
  Init(host_->GetMeasuredWidth(), host_->GetMeasuredHeight());
}

SnapshotBlurController::~SnapshotBlurController() { Destroy(); }

void SnapshotBlurController::Init(int32_t measured_width,
                                  int32_t measured_height) {
  SetBlurAutoUpdate(auto_update_);

  if (size_scaler_.IsZeroSized(measured_width, measured_height)) {
    // Nothing to blur yet. Draw is skipped until the host gets a real size.
    host_->SetWillNotDraw(true);
    return;
  }

  host_->SetWillNotDraw(false);

  ScaledSize scaled = size_scaler_.Scale(measured_width, measured_height);
  if (!snapshot_ || snapshot_->Size() != scaled.Size()) {
    auto bitmap = Bitmap::Make(scaled.width, scaled.height);
    if (!bitmap) {
      LOGE("Failed to allocate %dx%d blur snapshot", scaled.width,
           scaled.height);
      return;
    }
    snapshot_ = std::move(bitmap);

    if (capture_canvas_) {
      capture_canvas_->SetBitmap(snapshot_);
    } else {
      capture_canvas_ = std::make_unique<BlurCaptureCanvas>(snapshot_);
    }
  }

  state_ = State::kInitialized;
  UpdateBlur();
}

bool SnapshotBlurController::CurrentScale(ScaledSize* scale) const {
  if (!snapshot_) {
    return false;
  }

  int32_t width = host_->GetWidth();
  int32_t height = host_->GetHeight();
  if (width <= 0 || height <= 0) {
    return false;
  }

  scale->width = snapshot_->Width();
  scale->height = snapshot_->Height();
  scale->scale_factor_w =
      static_cast<float>(width) / static_cast<float>(scale->width);
  scale->scale_factor_h =
      static_cast<float>(height) / static_cast<float>(scale->height);
  return true;
}

void SnapshotBlurController::UpdateBlur() {
  if (!blur_enabled_ || state_ != State::kInitialized) {
    return;
  }

  ScaledSize scale;
  if (!CurrentScale(&scale)) {
    return;
  }

  tracker_.Refresh();

  CaptureTarget(capture_canvas_.get(), target_, frame_clear_drawable_.get(),
                ComputeCaptureMatrix(tracker_.Offset(), scale));

  BlurAndSave();

  ApplyFadeMask(scale);
}

void SnapshotBlurController::BlurAndSave() {
  auto blurred = algorithm_->Blur(snapshot_, blur_radius_);
  if (!blurred) {
    LOGE("Blur algorithm returned no bitmap, keeping the unblurred snapshot");
    return;
  }

  if (blurred != snapshot_) {
    snapshot_ = std::move(blurred);
    capture_canvas_->SetBitmap(snapshot_);
  }
}

void SnapshotBlurController::ApplyFadeMask(const ScaledSize& scale) {
  // The snapshot origin is the host origin, so the mask is not offset.
  auto mask = mask_cache_.GetShader(host_->GetWidth(), host_->GetHeight(), 0,
                                    0, gradient_direction_);
  if (!mask) {
    return;
  }

  Paint paint;
  paint.SetShader(std::move(mask));
  paint.SetBlendMode(BlendMode::kDstIn);

  int save_count = capture_canvas_->Save();
  capture_canvas_->Scale(1.f / scale.scale_factor_w,
                         1.f / scale.scale_factor_h);
  capture_canvas_->DrawRect(
      Rect::MakeWH(static_cast<float>(host_->GetWidth()),
                   static_cast<float>(host_->GetHeight())),
      paint);
  capture_canvas_->RestoreToCount(save_count);
}

bool SnapshotBlurController::Draw(Canvas* canvas) {
  if (!blur_enabled_ || state_ != State::kInitialized) {
    return false;
  }

  // The target contains the host, capturing the target reaches this draw.
  if (BlurCaptureCanvas::IsCaptureCanvas(canvas)) {
    return false;
  }

  ScaledSize scale;
  if (!CurrentScale(&scale)) {
    return false;
  }

  int32_t width = host_->GetWidth();
  int32_t height = host_->GetHeight();

  int save_count = canvas->Save();
  canvas->ClipRect(
      Rect::MakeWH(static_cast<float>(width), static_cast<float>(height)));

  canvas->Save();
  canvas->Scale(scale.scale_factor_w, scale.scale_factor_h);
  algorithm_->Render(canvas, snapshot_);
  canvas->Restore();

  overlay_.Composite(canvas, width, height);

  canvas->RestoreToCount(save_count);
  return true;
}

void SnapshotBlurController::UpdateSize() {
  if (state_ == State::kDestroyed) {
    return;
  }

  Init(host_->GetMeasuredWidth(), host_->GetMeasuredHeight());
}

void SnapshotBlurController::Destroy() {
  if (state_ == State::kDestroyed) {
    return;
  }

  target_window_subscription_.Reset();
  host_window_subscription_.Reset();

  algorithm_->Destroy();

  capture_canvas_.reset();
  snapshot_.reset();
  mask_cache_.Clear();

  state_ = State::kDestroyed;
}

bool SnapshotBlurController::OnPreDraw() {
  UpdateBlur();
  return true;
}

bool SnapshotBlurController::IsAutoUpdating() const {
  return target_window_subscription_.IsActive();
}

BlurController* SnapshotBlurController::SetBlurEnabled(bool enabled) {
  if (blur_enabled_ == enabled) {
    return this;
  }

  blur_enabled_ = enabled;
  SetBlurAutoUpdate(enabled);
  host_->Invalidate();
  return this;
}

BlurController* SnapshotBlurController::SetBlurAutoUpdate(bool enabled) {
  target_window_subscription_.Reset();
  host_window_subscription_.Reset();

  if (state_ == State::kDestroyed) {
    return this;
  }

  auto_update_ = enabled;
  if (!enabled) {
    return this;
  }

  PreDrawDispatcher* target_dispatcher = host_->GetTargetPreDrawDispatcher();
  PreDrawDispatcher* host_dispatcher = host_->GetPreDrawDispatcher();

  if (target_dispatcher) {
    target_window_subscription_ =
        target_dispatcher->Subscribe([this]() { return OnPreDraw(); });
  } else {
    LOGW("Blur host has no pre-draw dispatcher for the target window");
  }

  // The host may live in another window than the target, e.g. a dialog
  // blurring the activity behind it. Both windows trigger a refresh.
  if (host_dispatcher && host_dispatcher != target_dispatcher) {
    host_window_subscription_ =
        host_dispatcher->Subscribe([this]() { return OnPreDraw(); });
  }

  return this;
}

BlurController* SnapshotBlurController::SetFrameClearDrawable(
    std::shared_ptr<Drawable> drawable) {
  frame_clear_drawable_ = std::move(drawable);
  return this;
}

BlurController* SnapshotBlurController::SetBlurRadius(float radius) {
  if (radius < 0.f) {
    LOGW("Negative blur radius %f, clamped to 0", radius);
    radius = 0.f;
  }

  // Picked up by the next refresh.
  blur_radius_ = radius;
  return this;
}

BlurController* SnapshotBlurController::SetOverlayColor(Color color) {
  if (overlay_.SetOverlayColor(color)) {
    host_->Invalidate();
  }
  return this;
}

BlurController* SnapshotBlurController::SetBlurGradient(
    GradientDirection direction) {
  if (gradient_direction_ == direction) {
    return this;
  }

  gradient_direction_ = direction;
  if (direction == GradientDirection::kNone) {
    mask_cache_.Clear();
  }
  host_->Invalidate();
  return this;
}

BlurController* SnapshotBlurController::SetOverlayGradientColor(
    Color start_color, Color end_color, GradientDirection direction) {
  if (overlay_.SetOverlayGradientColor(start_color, end_color, direction)) {
    host_->Invalidate();
  }
  return this;
}

}  // namespace frost
