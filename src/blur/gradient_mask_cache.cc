// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include "src/blur/gradient_mask_cache.hpp"

#include <frost/graphic/color.hpp>

namespace frost {

std::shared_ptr<Shader> GradientMaskCache::GetShader(
    int32_t width, int32_t height, int32_t left, int32_t top,
    GradientDirection direction) {
  if (direction == GradientDirection::kNone) {
    Clear();
    return nullptr;
  }

  Key key{width, height, left, top, direction};
  if (shader_ && key_ == key) {
    return shader_;
  }

  shader_ = MakeMask(key);
  key_ = key;
  return shader_;
}

std::shared_ptr<Shader> GradientMaskCache::MakeMask(const Key& key) {
  // opaque keeps the blur, transparent reveals the sharp content
  constexpr Color kBlurred = Color_BLACK;
  constexpr Color kSharp = Color_TRANSPARENT;

  float left = static_cast<float>(key.left);
  float top = static_cast<float>(key.top);
  float right = left + static_cast<float>(key.width);
  float bottom = top + static_cast<float>(key.height);

  switch (key.direction) {
    case GradientDirection::kTopToBottom:
      return Shader::MakeLinear(Vec2{0.f, top}, Vec2{0.f, bottom}, kBlurred,
                                kSharp);
    case GradientDirection::kBottomToTop:
      return Shader::MakeLinear(Vec2{0.f, bottom}, Vec2{0.f, top}, kBlurred,
                                kSharp);
    case GradientDirection::kLeftToRight:
      return Shader::MakeLinear(Vec2{left, 0.f}, Vec2{right, 0.f}, kBlurred,
                                kSharp);
    case GradientDirection::kRightToLeft:
      return Shader::MakeLinear(Vec2{right, 0.f}, Vec2{left, 0.f}, kBlurred,
                                kSharp);
    case GradientDirection::kNone:
      break;
  }
  return nullptr;
}

}  // namespace frost
