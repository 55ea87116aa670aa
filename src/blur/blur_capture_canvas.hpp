// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef SRC_BLUR_BLUR_CAPTURE_CANVAS_HPP
#define SRC_BLUR_BLUR_CAPTURE_CANVAS_HPP

#include <frost/blur/blur_region.hpp>
#include <frost/geometry/matrix.hpp>
#include <frost/geometry/point.hpp>
#include <frost/render/bitmap_canvas.hpp>
#include <frost/render/drawable.hpp>
#include <memory>
#include <utility>

#include "src/blur/size_scaler.hpp"

namespace frost {

/**
 * Canvas the blur controllers capture into. Controllers refuse to draw into
 * it, so a blurred surface never captures itself or another blurred surface.
 */
class BlurCaptureCanvas final : public BitmapCanvas {
 public:
  explicit BlurCaptureCanvas(std::shared_ptr<Bitmap> bitmap)
      : BitmapCanvas(std::move(bitmap)) {}

  ~BlurCaptureCanvas() override = default;

  static bool IsCaptureCanvas(const Canvas* canvas) {
    return dynamic_cast<const BlurCaptureCanvas*>(canvas) != nullptr;
  }
};

/**
 * Maps target space into the scaled capture buffer so that the point of the
 * target directly behind the host origin lands on the buffer origin.
 *
 * @param offset  host location - target location
 * @param size    scaled buffer size and per axis scale factors
 */
Matrix ComputeCaptureMatrix(const IPoint& offset, const ScaledSize& size);

/**
 * Clear the capture with the frame clear drawable, or to transparent, then
 * draw the target under the capture matrix. Errors thrown by the target are
 * logged and the partially drawn content is kept.
 */
void CaptureTarget(BlurCaptureCanvas* canvas, BlurTarget* target,
                   Drawable* frame_clear, const Matrix& capture_matrix);

}  // namespace frost

#endif  // SRC_BLUR_BLUR_CAPTURE_CANVAS_HPP
