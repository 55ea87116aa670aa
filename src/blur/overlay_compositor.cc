// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include "src/blur/overlay_compositor.hpp"

#include <utility>

namespace frost {

OverlayCompositor::OverlayCompositor(Color overlay_color,
                                     std::shared_ptr<NoiseOverlay> noise)
    : overlay_color_(overlay_color), noise_(std::move(noise)) {
  paint_.SetAntiAlias(true);
}

bool OverlayCompositor::SetOverlayColor(Color color) {
  if (overlay_color_ == color) {
    return false;
  }
  overlay_color_ = color;
  start_color_ = Color_TRANSPARENT;
  end_color_ = Color_TRANSPARENT;
  return true;
}

bool OverlayCompositor::SetOverlayGradientColor(Color start_color,
                                                Color end_color,
                                                GradientDirection direction) {
  if (start_color_ == start_color && end_color_ == end_color &&
      direction_ == direction) {
    return false;
  }
  start_color_ = start_color;
  end_color_ = end_color;
  direction_ = direction;
  return true;
}

void OverlayCompositor::Composite(Canvas* canvas, int32_t width,
                                  int32_t height) {
  ApplyNoise(canvas, width, height);

  if (HasOverlayGradient()) {
    if (width > 0 && height > 0) {
      paint_.SetShader(gradient_cache_.GetShader(width, height, start_color_,
                                                 end_color_, direction_));
      canvas->DrawRect(Rect::MakeWH(width, height), paint_);
    }
  } else if (overlay_color_ != Color_TRANSPARENT) {
    canvas->DrawColor(overlay_color_);
  }
}

void OverlayCompositor::CompositeSolid(Canvas* canvas, int32_t width,
                                       int32_t height) {
  ApplyNoise(canvas, width, height);

  if (overlay_color_ != Color_TRANSPARENT) {
    canvas->DrawColor(overlay_color_);
  }
}

void OverlayCompositor::ApplyNoise(Canvas* canvas, int32_t width,
                                   int32_t height) {
  if (noise_) {
    noise_->Apply(canvas, Rect::MakeWH(width, height));
  }
}

}  // namespace frost
