// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_BLUR_BLUR_ALGORITHM_HPP
#define INCLUDE_FROST_BLUR_BLUR_ALGORITHM_HPP

#include <frost/graphic/bitmap.hpp>
#include <frost/macros.hpp>
#include <frost/render/canvas.hpp>
#include <memory>

namespace frost {

/**
 * Pluggable blur filter used by the snapshot strategy.
 */
class FROST_API BlurAlgorithm {
 public:
  virtual ~BlurAlgorithm() = default;

  /**
   * Blur bitmap.
   *
   * @param bitmap  bitmap to blur
   * @param radius  blur radius, >= 0
   * @return the blurred bitmap. Either the input, modified in place, or a new
   *         bitmap of the same size that replaces it.
   */
  virtual std::shared_ptr<Bitmap> Blur(std::shared_ptr<Bitmap> bitmap,
                                       float radius) = 0;

  /**
   * Free any resources held by the algorithm. Blur is not called afterwards.
   */
  virtual void Destroy() = 0;

  /**
   * @return true if Blur modifies its input in place
   */
  virtual bool CanModifyBitmap() const = 0;

  /**
   * Draw the blurred bitmap. The canvas is already scaled so the bitmap,
   * drawn at the origin, covers the blurred surface.
   */
  virtual void Render(Canvas* canvas, const std::shared_ptr<Bitmap>& bitmap);
};

}  // namespace frost

#endif  // INCLUDE_FROST_BLUR_BLUR_ALGORITHM_HPP
