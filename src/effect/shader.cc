// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include <cmath>
#include <frost/effect/shader.hpp>
#include <glm/glm.hpp>
#include <utility>

#include "src/effect/linear_gradient.hpp"
#include "src/logging.hpp"

namespace frost {

LinearGradient::LinearGradient(const Vec2 pts[2], std::vector<Color4f> colors,
                               std::vector<float> offsets, TileMode tile_mode)
    : points_{{pts[0], pts[1]}},
      colors_(std::move(colors)),
      offsets_(std::move(offsets)),
      tile_mode_(tile_mode) {}

Shader::GradientType LinearGradient::AsGradient(GradientInfo* info) const {
  if (info) {
    info->points = points_;
    info->colors = colors_;
    info->color_offsets = offsets_;
    info->tile_mode = tile_mode_;
  }
  return kLinear;
}

float LinearGradient::ApplyTileMode(float t) const {
  switch (tile_mode_) {
    case TileMode::kClamp:
      return glm::clamp(t, 0.f, 1.f);
    case TileMode::kRepeat:
      return t - std::floor(t);
    case TileMode::kMirror: {
      float f = t - 2.f * std::floor(t * 0.5f);
      return f > 1.f ? 2.f - f : f;
    }
  }
  return glm::clamp(t, 0.f, 1.f);
}

Color4f LinearGradient::ColorAt(const Vec2& point) const {
  Vec2 axis = points_[1] - points_[0];
  float length_sq = glm::dot(axis, axis);

  // degenerate gradient, behaves like the last color
  if (length_sq == 0.f) {
    return colors_.back();
  }

  float t = ApplyTileMode(glm::dot(point - points_[0], axis) / length_sq);

  if (t <= offsets_.front()) {
    return colors_.front();
  }

  for (size_t i = 1; i < offsets_.size(); i++) {
    if (t <= offsets_[i]) {
      float span = offsets_[i] - offsets_[i - 1];
      float local = span > 0.f ? (t - offsets_[i - 1]) / span : 1.f;
      return glm::mix(colors_[i - 1], colors_[i], local);
    }
  }

  return colors_.back();
}

std::shared_ptr<Shader> Shader::MakeLinear(const Vec2 pts[2],
                                           const Color4f colors[],
                                           const float pos[], int count,
                                           TileMode mode) {
  if (pts == nullptr || colors == nullptr || count < 2) {
    LOGE("Shader::MakeLinear invalid arguments, count = %d", count);
    return nullptr;
  }

  std::vector<Color4f> color_list(colors, colors + count);
  std::vector<float> offset_list(count);

  for (int i = 0; i < count; i++) {
    if (pos) {
      offset_list[i] = glm::clamp(pos[i], 0.f, 1.f);
      if (i > 0 && offset_list[i] < offset_list[i - 1]) {
        LOGE("Shader::MakeLinear color positions are not monotonic");
        return nullptr;
      }
    } else {
      offset_list[i] = static_cast<float>(i) / static_cast<float>(count - 1);
    }
  }

  return std::make_shared<LinearGradient>(pts, std::move(color_list),
                                          std::move(offset_list), mode);
}

std::shared_ptr<Shader> Shader::MakeLinear(const Vec2& start, const Vec2& end,
                                           Color start_color, Color end_color,
                                           TileMode mode) {
  Vec2 pts[2] = {start, end};
  Color4f colors[2] = {Color4fFromColor(start_color),
                       Color4fFromColor(end_color)};
  return MakeLinear(pts, colors, nullptr, 2, mode);
}

}  // namespace frost
