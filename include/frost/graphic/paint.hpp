// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_GRAPHIC_PAINT_HPP
#define INCLUDE_FROST_GRAPHIC_PAINT_HPP

#include <frost/effect/shader.hpp>
#include <frost/graphic/blend_mode.hpp>
#include <frost/graphic/color.hpp>
#include <frost/macros.hpp>
#include <memory>
#include <utility>

namespace frost {

enum class FilterMode {
  kNearest,
  kLinear,
};

/**
 * Paint controls how a draw call is colored and composited.
 */
class FROST_API Paint {
 public:
  Paint() = default;
  ~Paint() = default;

  Paint(const Paint&) = default;
  Paint& operator=(const Paint&) = default;

  void Reset() { *this = Paint{}; }

  Color GetColor() const { return color_; }
  void SetColor(Color color) { color_ = color; }

  float GetAlphaF() const { return ColorGetA(color_) / 255.f; }
  void SetAlphaF(float a);

  uint8_t GetAlpha() const { return ColorGetA(color_); }
  void SetAlpha(uint8_t alpha) { color_ = ColorSetA(color_, alpha); }

  const std::shared_ptr<Shader>& GetShader() const { return shader_; }
  void SetShader(std::shared_ptr<Shader> shader) { shader_ = std::move(shader); }

  BlendMode GetBlendMode() const { return blend_mode_; }
  void SetBlendMode(BlendMode mode) { blend_mode_ = mode; }

  FilterMode GetFilterMode() const { return filter_mode_; }
  void SetFilterMode(FilterMode mode) { filter_mode_ = mode; }

  bool IsAntiAlias() const { return anti_alias_; }
  void SetAntiAlias(bool aa) { anti_alias_ = aa; }

 private:
  Color color_ = Color_BLACK;
  std::shared_ptr<Shader> shader_ = {};
  BlendMode blend_mode_ = BlendMode::kDefault;
  FilterMode filter_mode_ = FilterMode::kNearest;
  bool anti_alias_ = false;
};

}  // namespace frost

#endif  // INCLUDE_FROST_GRAPHIC_PAINT_HPP
