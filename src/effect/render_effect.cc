// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include <cmath>
#include <frost/effect/render_effect.hpp>
#include <utility>

#include "src/logging.hpp"

namespace frost {

std::shared_ptr<RenderEffect> RenderEffect::MakeBlur(float radius_x,
                                                     float radius_y,
                                                     TileMode edge_mode) {
  if (!std::isfinite(radius_x) || !std::isfinite(radius_y) || radius_x < 0.f ||
      radius_y < 0.f) {
    LOGE("RenderEffect::MakeBlur invalid radius (%f, %f)", radius_x, radius_y);
    return nullptr;
  }

  auto effect = std::make_shared<RenderEffect>(Type::kBlur);
  effect->radius_x_ = radius_x;
  effect->radius_y_ = radius_y;
  effect->edge_mode_ = edge_mode;
  return effect;
}

std::shared_ptr<RenderEffect> RenderEffect::MakeShader(
    std::shared_ptr<Shader> shader) {
  if (!shader) {
    LOGE("RenderEffect::MakeShader with null shader");
    return nullptr;
  }

  auto effect = std::make_shared<RenderEffect>(Type::kShader);
  effect->shader_ = std::move(shader);
  return effect;
}

std::shared_ptr<RenderEffect> RenderEffect::MakeBlend(
    std::shared_ptr<RenderEffect> dst, std::shared_ptr<RenderEffect> src,
    BlendMode mode) {
  if (!dst || !src) {
    LOGE("RenderEffect::MakeBlend requires both dst and src");
    return nullptr;
  }

  auto effect = std::make_shared<RenderEffect>(Type::kBlend);
  effect->blend_mode_ = mode;
  effect->inputs_ = {std::move(dst), std::move(src)};
  return effect;
}

}  // namespace frost
