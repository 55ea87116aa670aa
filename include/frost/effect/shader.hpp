// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_EFFECT_SHADER_HPP
#define INCLUDE_FROST_EFFECT_SHADER_HPP

#include <array>
#include <frost/geometry/point.hpp>
#include <frost/graphic/color.hpp>
#include <frost/macros.hpp>
#include <memory>
#include <vector>

namespace frost {

enum class TileMode {
  kClamp,
  kRepeat,
  kMirror,
};

/**
 * Shaders specify the source color(s) for what is being drawn. Shaders are
 * immutable once created and shared by pointer, so two draws using the same
 * shader instance are guaranteed to produce the same colors.
 */
class FROST_API Shader {
 public:
  enum GradientType {
    kNone,
    kLinear,
  };

  struct GradientInfo {
    /**
     * Start and end point for linear gradient.
     */
    std::array<Vec2, 2> points = {};
    std::vector<Color4f> colors = {};
    std::vector<float> color_offsets = {};
    TileMode tile_mode = TileMode::kClamp;
  };

  Shader() = default;
  virtual ~Shader() = default;

  Shader(const Shader&) = delete;
  Shader& operator=(const Shader&) = delete;

  virtual GradientType AsGradient(GradientInfo* info) const { return kNone; }

  /**
   * Evaluate the shader at a point in the local coordinate space of the draw
   * using it.
   */
  virtual Color4f ColorAt(const Vec2& point) const = 0;

  /**
   * Create a linear gradient shader between two points.
   *
   * @param pts       The start and end points for the gradient.
   * @param colors    The array of colors, to be distributed between the two
   *                  points.
   * @param pos       May be null. The relative position of each corresponding
   *                  color in the colors array. If this is null, then the
   *                  colors are distributed evenly between the start and end
   *                  point. If not null, values must be monotonic in [0, 1].
   * @param count     Must be >= 2. The number of colors (and pos if not null)
   *                  entries.
   * @param mode      The tiling mode.
   *
   * @return null if the arguments are invalid.
   */
  static std::shared_ptr<Shader> MakeLinear(const Vec2 pts[2],
                                            const Color4f colors[],
                                            const float pos[], int count,
                                            TileMode mode = TileMode::kClamp);

  /**
   * Convenience overload for a two stop gradient between 32-bit colors.
   */
  static std::shared_ptr<Shader> MakeLinear(const Vec2& start, const Vec2& end,
                                            Color start_color, Color end_color,
                                            TileMode mode = TileMode::kClamp);
};

}  // namespace frost

#endif  // INCLUDE_FROST_EFFECT_SHADER_HPP
