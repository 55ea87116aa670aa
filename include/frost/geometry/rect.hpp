// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_GEOMETRY_RECT_HPP
#define INCLUDE_FROST_GEOMETRY_RECT_HPP

#include <algorithm>
#include <frost/geometry/point.hpp>
#include <limits>

namespace frost {

/**
 * Axis aligned rectangle stored as left, top, right, bottom.
 */
class Rect {
 public:
  constexpr Rect() = default;
  constexpr Rect(float left, float top, float right, float bottom)
      : left_(left), top_(top), right_(right), bottom_(bottom) {}

  static constexpr Rect MakeEmpty() { return Rect{}; }

  static constexpr Rect MakeWH(float w, float h) { return Rect{0, 0, w, h}; }

  static constexpr Rect MakeXYWH(float x, float y, float w, float h) {
    return Rect{x, y, x + w, y + h};
  }

  static constexpr Rect MakeLTRB(float l, float t, float r, float b) {
    return Rect{l, t, r, b};
  }

  static constexpr Rect MakeLargest() {
    return Rect{std::numeric_limits<float>::lowest() / 2.f,
                std::numeric_limits<float>::lowest() / 2.f,
                std::numeric_limits<float>::max() / 2.f,
                std::numeric_limits<float>::max() / 2.f};
  }

  constexpr float Left() const { return left_; }
  constexpr float Top() const { return top_; }
  constexpr float Right() const { return right_; }
  constexpr float Bottom() const { return bottom_; }
  constexpr float X() const { return left_; }
  constexpr float Y() const { return top_; }
  constexpr float Width() const { return right_ - left_; }
  constexpr float Height() const { return bottom_ - top_; }
  constexpr float CenterX() const { return (left_ + right_) * 0.5f; }
  constexpr float CenterY() const { return (top_ + bottom_) * 0.5f; }

  constexpr bool IsEmpty() const {
    // use !(a < b) so that NaN values also count as empty
    return !(left_ < right_ && top_ < bottom_);
  }

  constexpr bool Contains(float x, float y) const {
    return x >= left_ && x < right_ && y >= top_ && y < bottom_;
  }

  void SetLTRB(float left, float top, float right, float bottom) {
    left_ = left;
    top_ = top;
    right_ = right;
    bottom_ = bottom;
  }

  void SetEmpty() { *this = MakeEmpty(); }

  void Offset(float dx, float dy) {
    left_ += dx;
    top_ += dy;
    right_ += dx;
    bottom_ += dy;
  }

  /**
   * Intersect this rect with other. If they do not overlap this rect is set to
   * empty and false is returned.
   */
  bool Intersect(const Rect& other) {
    float l = std::max(left_, other.left_);
    float t = std::max(top_, other.top_);
    float r = std::min(right_, other.right_);
    float b = std::min(bottom_, other.bottom_);

    if (!(l < r && t < b)) {
      SetEmpty();
      return false;
    }

    SetLTRB(l, t, r, b);
    return true;
  }

  constexpr bool operator==(const Rect& other) const {
    return left_ == other.left_ && top_ == other.top_ &&
           right_ == other.right_ && bottom_ == other.bottom_;
  }

  constexpr bool operator!=(const Rect& other) const {
    return !(*this == other);
  }

 private:
  float left_ = 0.f;
  float top_ = 0.f;
  float right_ = 0.f;
  float bottom_ = 0.f;
};

}  // namespace frost

#endif  // INCLUDE_FROST_GEOMETRY_RECT_HPP
