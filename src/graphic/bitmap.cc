// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include <algorithm>
#include <frost/graphic/bitmap.hpp>

#include "src/logging.hpp"

namespace frost {

std::shared_ptr<Bitmap> Bitmap::Make(uint32_t width, uint32_t height) {
  if (width == 0 || height == 0) {
    LOGE("Bitmap::Make with empty size %ux%u", width, height);
    return nullptr;
  }

  return std::make_shared<Bitmap>(width, height);
}

Bitmap::Bitmap(uint32_t width, uint32_t height)
    : width_(width),
      height_(height),
      pixels_(static_cast<size_t>(width) * height, Color_TRANSPARENT) {}

void Bitmap::EraseColor(Color color) {
  std::fill(pixels_.begin(), pixels_.end(), color);
}

Color Bitmap::GetPixel(uint32_t x, uint32_t y) const {
  if (x >= width_ || y >= height_) {
    return Color_TRANSPARENT;
  }
  return pixels_[static_cast<size_t>(y) * width_ + x];
}

void Bitmap::SetPixel(uint32_t x, uint32_t y, Color color) {
  if (x >= width_ || y >= height_) {
    return;
  }
  pixels_[static_cast<size_t>(y) * width_ + x] = color;
}

}  // namespace frost
