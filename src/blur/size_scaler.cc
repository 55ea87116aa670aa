// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include "src/blur/size_scaler.hpp"

#include <algorithm>
#include <cmath>

namespace frost {

SizeScaler::SizeScaler(float scale_factor)
    : scale_factor_(std::max(scale_factor, 1.f)) {}

ScaledSize SizeScaler::Scale(int32_t width, int32_t height) const {
  int32_t scaled_width = DownscaleSize(static_cast<float>(width));
  int32_t scaled_height = DownscaleSize(static_cast<float>(height));

  ScaledSize size;
  size.width = scaled_width;
  size.height = scaled_height;
  size.scale_factor_w = scaled_width > 0
                            ? static_cast<float>(width) / scaled_width
                            : scale_factor_;
  size.scale_factor_h = scaled_height > 0
                            ? static_cast<float>(height) / scaled_height
                            : scale_factor_;
  return size;
}

bool SizeScaler::IsZeroSized(int32_t width, int32_t height) const {
  return scale_factor_ == 1.f || width <= 0 || height <= 0;
}

int32_t SizeScaler::DownscaleSize(float value) const {
  if (value <= 0.f) {
    return 0;
  }
  // never downscale a non empty side to 0
  return std::max(1, static_cast<int32_t>(std::lround(value / scale_factor_)));
}

}  // namespace frost
