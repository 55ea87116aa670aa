// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef SRC_BLUR_SIZE_SCALER_HPP
#define SRC_BLUR_SIZE_SCALER_HPP

#include <cstdint>
#include <frost/geometry/point.hpp>

namespace frost {

struct ScaledSize {
  int32_t width = 0;
  int32_t height = 0;

  // original / scaled, per axis. They differ slightly from the scale factor
  // because the scaled size is rounded.
  float scale_factor_w = 1.f;
  float scale_factor_h = 1.f;

  ISize Size() const { return ISize{width, height}; }

  bool operator==(const ScaledSize& other) const {
    return width == other.width && height == other.height &&
           scale_factor_w == other.scale_factor_w &&
           scale_factor_h == other.scale_factor_h;
  }
};

/**
 * Computes the size of the downscaled snapshot buffer.
 */
class SizeScaler {
 public:
  explicit SizeScaler(float scale_factor);

  float GetScaleFactor() const { return scale_factor_; }

  ScaledSize Scale(int32_t width, int32_t height) const;

  /**
   * True when there is nothing to downscale into: the scale factor is exactly
   * 1 or either dimension is 0.
   */
  bool IsZeroSized(int32_t width, int32_t height) const;

 private:
  int32_t DownscaleSize(float value) const;

 private:
  float scale_factor_;
};

}  // namespace frost

#endif  // SRC_BLUR_SIZE_SCALER_HPP
