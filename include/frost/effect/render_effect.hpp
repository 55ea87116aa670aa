// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_EFFECT_RENDER_EFFECT_HPP
#define INCLUDE_FROST_EFFECT_RENDER_EFFECT_HPP

#include <frost/effect/shader.hpp>
#include <frost/graphic/blend_mode.hpp>
#include <frost/macros.hpp>
#include <memory>
#include <vector>

namespace frost {

/**
 * A node of a declarative filter graph attached to a RenderNode. The graph is
 * only a description: the rendering backend that draws the node evaluates it
 * every frame, so nothing is computed on the CPU when an effect is created.
 *
 * Effects are immutable and can be shared between nodes.
 */
class FROST_API RenderEffect {
 public:
  enum class Type {
    kBlur,
    kShader,
    kBlend,
  };

  /**
   * Blur the content of the node.
   *
   * @param radius_x  blur radius along the x axis, must be >= 0
   * @param radius_y  blur radius along the y axis, must be >= 0
   * @param edge_mode how pixels outside the content are sampled
   *
   * @return null if either radius is negative or not finite
   */
  static std::shared_ptr<RenderEffect> MakeBlur(
      float radius_x, float radius_y, TileMode edge_mode = TileMode::kClamp);

  /**
   * Fill the node bounds with a shader, ignoring the node content.
   */
  static std::shared_ptr<RenderEffect> MakeShader(
      std::shared_ptr<Shader> shader);

  /**
   * Composite src onto dst with the given blend mode.
   */
  static std::shared_ptr<RenderEffect> MakeBlend(
      std::shared_ptr<RenderEffect> dst, std::shared_ptr<RenderEffect> src,
      BlendMode mode);

  Type GetType() const { return type_; }

  float GetRadiusX() const { return radius_x_; }
  float GetRadiusY() const { return radius_y_; }
  TileMode GetEdgeMode() const { return edge_mode_; }

  const std::shared_ptr<Shader>& GetShader() const { return shader_; }

  BlendMode GetBlendMode() const { return blend_mode_; }

  /**
   * For kBlend effects, returns {dst, src}. Empty for other types.
   */
  const std::vector<std::shared_ptr<RenderEffect>>& GetInputs() const {
    return inputs_;
  }

  explicit RenderEffect(Type type) : type_(type) {}

 private:
  Type type_;
  float radius_x_ = 0.f;
  float radius_y_ = 0.f;
  TileMode edge_mode_ = TileMode::kClamp;
  std::shared_ptr<Shader> shader_ = {};
  BlendMode blend_mode_ = BlendMode::kDefault;
  std::vector<std::shared_ptr<RenderEffect>> inputs_ = {};
};

}  // namespace frost

#endif  // INCLUDE_FROST_EFFECT_RENDER_EFFECT_HPP
