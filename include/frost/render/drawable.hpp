// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_RENDER_DRAWABLE_HPP
#define INCLUDE_FROST_RENDER_DRAWABLE_HPP

#include <frost/geometry/rect.hpp>
#include <frost/graphic/color.hpp>
#include <frost/macros.hpp>
#include <frost/render/canvas.hpp>

namespace frost {

/**
 * Something that knows how to draw itself into its bounds.
 */
class FROST_API Drawable {
 public:
  virtual ~Drawable() = default;

  void SetBounds(const Rect& bounds) { bounds_ = bounds; }
  const Rect& GetBounds() const { return bounds_; }

  virtual void Draw(Canvas* canvas) = 0;

 private:
  Rect bounds_ = {};
};

/**
 * Fills its bounds with a color. With empty bounds it fills the whole clip of
 * the canvas, which is what a window background needs.
 */
class FROST_API ColorDrawable : public Drawable {
 public:
  explicit ColorDrawable(Color color) : color_(color) {}
  ~ColorDrawable() override = default;

  Color GetColor() const { return color_; }
  void SetColor(Color color) { color_ = color; }

  void Draw(Canvas* canvas) override;

 private:
  Color color_;
};

}  // namespace frost

#endif  // INCLUDE_FROST_RENDER_DRAWABLE_HPP
