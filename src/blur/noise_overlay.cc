// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include <frost/blur/noise_overlay.hpp>
#include <utility>

#include "src/logging.hpp"

namespace frost {

TiledNoiseOverlay::TiledNoiseOverlay(std::shared_ptr<Bitmap> tile,
                                     float alpha)
    : tile_(std::move(tile)), alpha_(alpha) {}

void TiledNoiseOverlay::Apply(Canvas* canvas, const Rect& bounds) {
  if (!tile_) {
    LOGW("TiledNoiseOverlay without a noise tile");
    return;
  }

  if (bounds.IsEmpty()) {
    return;
  }

  Paint paint;
  paint.SetAlphaF(alpha_);

  float tile_w = static_cast<float>(tile_->Width());
  float tile_h = static_cast<float>(tile_->Height());

  int save_count = canvas->Save();
  canvas->ClipRect(bounds);
  for (float y = bounds.Top(); y < bounds.Bottom(); y += tile_h) {
    for (float x = bounds.Left(); x < bounds.Right(); x += tile_w) {
      canvas->DrawBitmap(tile_, x, y, &paint);
    }
  }
  canvas->RestoreToCount(save_count);
}

}  // namespace frost
