// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_RENDER_BITMAP_CANVAS_HPP
#define INCLUDE_FROST_RENDER_BITMAP_CANVAS_HPP

#include <frost/graphic/bitmap.hpp>
#include <frost/macros.hpp>
#include <frost/render/canvas.hpp>
#include <memory>

namespace frost {

/**
 * Software canvas rasterizing into a Bitmap.
 *
 * A pixel is covered when its center lies inside the transformed geometry.
 * There is no anti-aliasing; edges snap to pixel centers.
 */
class FROST_API BitmapCanvas : public Canvas {
 public:
  explicit BitmapCanvas(std::shared_ptr<Bitmap> bitmap);
  ~BitmapCanvas() override = default;

  /**
   * Retarget the canvas. Matrix and clip state are reset.
   */
  void SetBitmap(std::shared_ptr<Bitmap> bitmap);

  const std::shared_ptr<Bitmap>& GetBitmap() const { return bitmap_; }

 protected:
  void OnDrawRect(const Rect& rect, const Paint& paint) override;
  void OnDrawPaint(const Paint& paint) override;
  void OnDrawBitmap(const std::shared_ptr<Bitmap>& bitmap, float left,
                    float top, const Paint& paint) override;
  void OnDrawRenderNode(RenderNode* node) override;

 private:
  Rect BitmapBounds() const;

 private:
  std::shared_ptr<Bitmap> bitmap_;
};

}  // namespace frost

#endif  // INCLUDE_FROST_RENDER_BITMAP_CANVAS_HPP
