// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include "src/blur/render_node_blur_controller.hpp"

#include <frost/effect/render_effect.hpp>
#include <utility>

#include "src/blur/size_scaler.hpp"
#include "src/logging.hpp"

namespace frost {

RenderNodeBlurController::RenderNodeBlurController(
    const BlurControllerDescriptor& desc)
    : host_(desc.host),
      target_(desc.target),
      scale_factor_(desc.scale_factor < 1.f ? 1.f : desc.scale_factor),
      blur_node_("frost blur node"),
      tracker_(desc.host, desc.target),
      overlay_(desc.overlay_color, desc.noise),
      reapply_effect_on_transform_change_(
          desc.reapply_effect_on_transform_change),
      fallback_factory_(desc.fallback_algorithm_factory) {
  host_->SetWillNotDraw(false);
  SetBlurAutoUpdate(true);
}

RenderNodeBlurController::~RenderNodeBlurController() { Destroy(); }

bool RenderNodeBlurController::OnPreDraw() {
  tracker_.Refresh();
  UpdateNodeProperties();
  return true;
}

bool RenderNodeBlurController::Draw(Canvas* canvas) {
  if (!blur_enabled_ || destroyed_) {
    return false;
  }

  if (BlurCaptureCanvas::IsCaptureCanvas(canvas)) {
    return false;
  }

  tracker_.Refresh();

  if (canvas->IsHardwareAccelerated()) {
    HardwareDraw(canvas);
  } else {
    SoftwareDraw(canvas);
  }
  return true;
}

void RenderNodeBlurController::HardwareDraw(Canvas* canvas) {
  blur_node_.SetPosition(
      Rect::MakeWH(static_cast<float>(target_->GetWidth()),
                   static_cast<float>(target_->GetHeight())));
  UpdateNodeProperties();
  RecordBlurNode();

  int32_t width = host_->GetWidth();
  int32_t height = host_->GetHeight();

  int save_count = canvas->Save();
  canvas->ClipRect(
      Rect::MakeWH(static_cast<float>(width), static_cast<float>(height)));
  canvas->DrawRenderNode(&blur_node_);
  overlay_.Composite(canvas, width, height);
  canvas->RestoreToCount(save_count);
}

void RenderNodeBlurController::RecordBlurNode() {
  RecordingCanvas* recording = blur_node_.BeginRecording();

  if (frame_clear_drawable_) {
    frame_clear_drawable_->Draw(recording);
  }

  RenderNode* target_node = target_->GetRenderNode();
  if (target_node) {
    recording->DrawRenderNode(target_node);
  } else {
    LOGW("Blur target lost its render node, blurring an empty frame");
  }

  ApplyBlur();
  blur_node_.EndRecording();
}

void RenderNodeBlurController::UpdateNodeProperties() {
  float translation_x = -static_cast<float>(tracker_.GetLeft());
  float translation_y = -static_cast<float>(tracker_.GetTop());

  // Pivot at the host center so host rotation and scale are countered
  // around the right point.
  blur_node_.SetPivotX(host_->GetWidth() / 2.f - translation_x);
  blur_node_.SetPivotY(host_->GetHeight() / 2.f - translation_y);
  blur_node_.SetTranslationX(translation_x);
  blur_node_.SetTranslationY(translation_y);

  if (reapply_effect_on_transform_change_) {
    ApplyBlur();
  }
}

void RenderNodeBlurController::ApplyBlur() {
  if (destroyed_) {
    return;
  }

  // The snapshot strategy blurs a downscaled buffer. Scaling the radius here
  // keeps both strategies visually equivalent.
  float radius = blur_radius_ * scale_factor_;
  auto effect = RenderEffect::MakeBlur(radius, radius, TileMode::kClamp);
  if (!effect) {
    LOGE("Invalid blur radius %f", radius);
    return;
  }

  int32_t width = host_->GetWidth();
  int32_t height = host_->GetHeight();

  if (gradient_direction_ == GradientDirection::kNone) {
    mask_cache_.Clear();
  } else if (width > 0 && height > 0) {
    auto mask = mask_cache_.GetShader(width, height, tracker_.GetLeft(),
                                      tracker_.GetTop(), gradient_direction_);
    if (mask) {
      effect = RenderEffect::MakeBlend(effect, RenderEffect::MakeShader(mask),
                                       BlendMode::kDstIn);
    }
  }

  blur_node_.SetRenderEffect(std::move(effect));
}

BlurAlgorithm* RenderNodeBlurController::GetFallbackAlgorithm() {
  if (!fallback_requested_) {
    fallback_requested_ = true;
    if (fallback_factory_) {
      fallback_algorithm_ = fallback_factory_();
    }
  }

  if (!fallback_algorithm_) {
    warn_no_fallback_([]() {
      LOGW("No fallback blur algorithm, software canvas shows unblurred "
           "content");
    });
  }
  return fallback_algorithm_.get();
}

void RenderNodeBlurController::SoftwareDraw(Canvas* canvas) {
  int32_t width = host_->GetWidth();
  int32_t height = host_->GetHeight();
  if (width <= 0 || height <= 0) {
    return;
  }

  ScaledSize scaled = SizeScaler(scale_factor_).Scale(width, height);
  if (!software_snapshot_ || software_snapshot_->Size() != scaled.Size()) {
    auto bitmap = Bitmap::Make(scaled.width, scaled.height);
    if (!bitmap) {
      LOGE("Failed to allocate %dx%d software blur snapshot", scaled.width,
           scaled.height);
      return;
    }
    software_snapshot_ = std::move(bitmap);
    software_canvas_ = std::make_unique<BlurCaptureCanvas>(software_snapshot_);
  }

  CaptureTarget(software_canvas_.get(), target_, frame_clear_drawable_.get(),
                ComputeCaptureMatrix(tracker_.Offset(), scaled));

  BlurAlgorithm* algorithm = GetFallbackAlgorithm();
  if (algorithm) {
    auto blurred = algorithm->Blur(software_snapshot_, blur_radius_);
    if (!blurred) {
      LOGE("Fallback blur algorithm returned no bitmap");
    } else if (blurred != software_snapshot_) {
      software_snapshot_ = std::move(blurred);
      software_canvas_->SetBitmap(software_snapshot_);
    }
  }

  int save_count = canvas->Save();
  canvas->ClipRect(
      Rect::MakeWH(static_cast<float>(width), static_cast<float>(height)));

  canvas->Save();
  canvas->Scale(scaled.scale_factor_w, scaled.scale_factor_h);
  if (algorithm) {
    algorithm->Render(canvas, software_snapshot_);
  } else {
    Paint paint;
    paint.SetFilterMode(FilterMode::kLinear);
    canvas->DrawBitmap(software_snapshot_, 0.f, 0.f, &paint);
  }
  canvas->Restore();

  // Gradients are not supported on this path.
  overlay_.CompositeSolid(canvas, width, height);

  canvas->RestoreToCount(save_count);
}

void RenderNodeBlurController::UpdateRotation(float degrees) {
  blur_node_.SetRotationZ(-degrees);
  if (reapply_effect_on_transform_change_) {
    ApplyBlur();
  }
}

void RenderNodeBlurController::UpdateScaleX(float scale_x) {
  if (scale_x == 0.f) {
    LOGW("Ignoring zero host scale x");
    return;
  }
  blur_node_.SetScaleX(1.f / scale_x);
  if (reapply_effect_on_transform_change_) {
    ApplyBlur();
  }
}

void RenderNodeBlurController::UpdateScaleY(float scale_y) {
  if (scale_y == 0.f) {
    LOGW("Ignoring zero host scale y");
    return;
  }
  blur_node_.SetScaleY(1.f / scale_y);
  if (reapply_effect_on_transform_change_) {
    ApplyBlur();
  }
}

void RenderNodeBlurController::Destroy() {
  if (destroyed_) {
    return;
  }

  subscription_.Reset();
  blur_node_.DiscardDisplayList();
  blur_node_.SetRenderEffect(nullptr);
  mask_cache_.Clear();

  if (fallback_algorithm_) {
    fallback_algorithm_->Destroy();
    fallback_algorithm_.reset();
  }
  software_canvas_.reset();
  software_snapshot_.reset();

  destroyed_ = true;
}

BlurController* RenderNodeBlurController::SetBlurEnabled(bool enabled) {
  if (blur_enabled_ == enabled) {
    return this;
  }

  blur_enabled_ = enabled;
  host_->Invalidate();
  return this;
}

BlurController* RenderNodeBlurController::SetBlurAutoUpdate(bool enabled) {
  subscription_.Reset();

  if (!enabled || destroyed_) {
    return this;
  }

  PreDrawDispatcher* dispatcher = host_->GetPreDrawDispatcher();
  if (!dispatcher) {
    LOGW("Blur host has no pre-draw dispatcher");
    return this;
  }
  subscription_ = dispatcher->Subscribe([this]() { return OnPreDraw(); });
  return this;
}

BlurController* RenderNodeBlurController::SetFrameClearDrawable(
    std::shared_ptr<Drawable> drawable) {
  frame_clear_drawable_ = std::move(drawable);
  return this;
}

BlurController* RenderNodeBlurController::SetBlurRadius(float radius) {
  if (radius < 0.f) {
    LOGW("Negative blur radius %f, clamped to 0", radius);
    radius = 0.f;
  }

  if (blur_radius_ == radius) {
    return this;
  }

  blur_radius_ = radius;
  ApplyBlur();
  return this;
}

BlurController* RenderNodeBlurController::SetOverlayColor(Color color) {
  if (overlay_.SetOverlayColor(color)) {
    host_->Invalidate();
  }
  return this;
}

BlurController* RenderNodeBlurController::SetBlurGradient(
    GradientDirection direction) {
  if (gradient_direction_ == direction) {
    return this;
  }

  gradient_direction_ = direction;
  ApplyBlur();
  host_->Invalidate();
  return this;
}

BlurController* RenderNodeBlurController::SetOverlayGradientColor(
    Color start_color, Color end_color, GradientDirection direction) {
  if (overlay_.SetOverlayGradientColor(start_color, end_color, direction)) {
    host_->Invalidate();
  }
  return this;
}

}  // namespace frost
