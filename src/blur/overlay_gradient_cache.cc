// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include "src/blur/overlay_gradient_cache.hpp"

namespace frost {

std::shared_ptr<Shader> OverlayGradientCache::GetShader(
    int32_t width, int32_t height, Color start_color, Color end_color,
    GradientDirection direction) {
  Key key{width, height, start_color, end_color, direction};
  if (shader_ && key_ == key) {
    return shader_;
  }

  float right = static_cast<float>(width);
  float bottom = static_cast<float>(height);

  std::shared_ptr<Shader> shader;
  switch (direction) {
    case GradientDirection::kBottomToTop:
      shader = Shader::MakeLinear(Vec2{0.f, bottom}, Vec2{0.f, 0.f},
                                  start_color, end_color);
      break;
    case GradientDirection::kLeftToRight:
      shader = Shader::MakeLinear(Vec2{0.f, 0.f}, Vec2{right, 0.f},
                                  start_color, end_color);
      break;
    case GradientDirection::kRightToLeft:
      shader = Shader::MakeLinear(Vec2{right, 0.f}, Vec2{0.f, 0.f},
                                  start_color, end_color);
      break;
    case GradientDirection::kTopToBottom:
    case GradientDirection::kNone:
      // TODO(frost): decide whether kNone should draw start_color as a solid
      // overlay instead of a vertical gradient.
      shader = Shader::MakeLinear(Vec2{0.f, 0.f}, Vec2{0.f, bottom},
                                  start_color, end_color);
      break;
  }

  shader_ = shader;
  key_ = key;
  return shader_;
}

}  // namespace frost
