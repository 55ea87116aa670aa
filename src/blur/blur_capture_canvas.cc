// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include "src/blur/blur_capture_canvas.hpp"

#include <exception>

#include "src/logging.hpp"

namespace frost {

Matrix ComputeCaptureMatrix(const IPoint& offset, const ScaledSize& size) {
  float scaled_left = -static_cast<float>(offset.x) / size.scale_factor_w;
  float scaled_top = -static_cast<float>(offset.y) / size.scale_factor_h;

  Matrix matrix = Matrix::Translate(scaled_left, scaled_top);
  matrix.PreScale(1.f / size.scale_factor_w, 1.f / size.scale_factor_h);
  return matrix;
}

void CaptureTarget(BlurCaptureCanvas* canvas, BlurTarget* target,
                   Drawable* frame_clear, const Matrix& capture_matrix) {
  if (frame_clear) {
    frame_clear->Draw(canvas);
  } else {
    canvas->GetBitmap()->EraseColor(Color_TRANSPARENT);
  }

  int save_count = canvas->Save();
  canvas->Concat(capture_matrix);
  try {
    target->Draw(canvas);
  } catch (const std::exception& e) {
    LOGE("Error during snapshot capturing: %s", e.what());
  }
  canvas->RestoreToCount(save_count);
}

}  // namespace frost
