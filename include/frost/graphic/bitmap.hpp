// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_GRAPHIC_BITMAP_HPP
#define INCLUDE_FROST_GRAPHIC_BITMAP_HPP

#include <cstddef>
#include <cstdint>
#include <frost/geometry/point.hpp>
#include <frost/graphic/color.hpp>
#include <frost/macros.hpp>
#include <memory>
#include <vector>

namespace frost {

/**
 * CPU raster buffer of unpremultiplied ARGB pixels, row major, no padding.
 */
class FROST_API Bitmap {
 public:
  /**
   * @return null if either dimension is zero
   */
  static std::shared_ptr<Bitmap> Make(uint32_t width, uint32_t height);

  Bitmap(uint32_t width, uint32_t height);

  ~Bitmap() = default;

  uint32_t Width() const { return width_; }
  uint32_t Height() const { return height_; }
  ISize Size() const {
    return ISize{static_cast<int32_t>(width_), static_cast<int32_t>(height_)};
  }

  size_t RowBytes() const { return width_ * sizeof(Color); }

  Color* Pixels() { return pixels_.data(); }
  const Color* Pixels() const { return pixels_.data(); }

  void EraseColor(Color color);

  Color GetPixel(uint32_t x, uint32_t y) const;

  void SetPixel(uint32_t x, uint32_t y, Color color);

 private:
  uint32_t width_;
  uint32_t height_;
  std::vector<Color> pixels_;
};

}  // namespace frost

#endif  // INCLUDE_FROST_GRAPHIC_BITMAP_HPP
