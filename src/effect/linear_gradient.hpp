// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef SRC_EFFECT_LINEAR_GRADIENT_HPP
#define SRC_EFFECT_LINEAR_GRADIENT_HPP

#include <frost/effect/shader.hpp>
#include <vector>

namespace frost {

class LinearGradient : public Shader {
 public:
  LinearGradient(const Vec2 pts[2], std::vector<Color4f> colors,
                 std::vector<float> offsets, TileMode tile_mode);

  ~LinearGradient() override = default;

  GradientType AsGradient(GradientInfo* info) const override;

  Color4f ColorAt(const Vec2& point) const override;

 private:
  float ApplyTileMode(float t) const;

 private:
  std::array<Vec2, 2> points_;
  std::vector<Color4f> colors_;
  std::vector<float> offsets_;
  TileMode tile_mode_;
};

}  // namespace frost

#endif  // SRC_EFFECT_LINEAR_GRADIENT_HPP
