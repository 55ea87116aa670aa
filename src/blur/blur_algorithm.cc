// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include <frost/blur/blur_algorithm.hpp>

namespace frost {

void BlurAlgorithm::Render(Canvas* canvas,
                           const std::shared_ptr<Bitmap>& bitmap) {
  Paint paint;
  paint.SetFilterMode(FilterMode::kLinear);
  canvas->DrawBitmap(bitmap, 0.f, 0.f, &paint);
}

}  // namespace frost
