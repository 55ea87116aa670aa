// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_BLUR_NOISE_OVERLAY_HPP
#define INCLUDE_FROST_BLUR_NOISE_OVERLAY_HPP

#include <frost/geometry/rect.hpp>
#include <frost/graphic/bitmap.hpp>
#include <frost/macros.hpp>
#include <frost/render/canvas.hpp>
#include <memory>

namespace frost {

/**
 * Dithering layer drawn over blurred content to hide banding.
 */
class FROST_API NoiseOverlay {
 public:
  virtual ~NoiseOverlay() = default;

  virtual void Apply(Canvas* canvas, const Rect& bounds) = 0;
};

/**
 * Repeats a noise texture over the bounds, unscaled, with a fixed alpha.
 */
class FROST_API TiledNoiseOverlay : public NoiseOverlay {
 public:
  static constexpr float kDefaultAlpha = 0.06f;

  explicit TiledNoiseOverlay(std::shared_ptr<Bitmap> tile,
                             float alpha = kDefaultAlpha);
  ~TiledNoiseOverlay() override = default;

  void Apply(Canvas* canvas, const Rect& bounds) override;

 private:
  std::shared_ptr<Bitmap> tile_;
  float alpha_;
};

}  // namespace frost

#endif  // INCLUDE_FROST_BLUR_NOISE_OVERLAY_HPP
