// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_GEOMETRY_MATRIX_HPP
#define INCLUDE_FROST_GEOMETRY_MATRIX_HPP

#include <frost/geometry/point.hpp>
#include <frost/geometry/rect.hpp>
#include <frost/macros.hpp>
#include <glm/glm.hpp>

namespace frost {

/**
 * 3x3 matrix for 2D affine transforms. Points are treated as column vectors,
 * so `a * b` maps a point through `b` first and then through `a`.
 */
class FROST_API Matrix {
 public:
  Matrix() : m_(1.f) {}
  explicit Matrix(const glm::mat3& m) : m_(m) {}

  static Matrix Translate(float dx, float dy);
  static Matrix Scale(float sx, float sy);
  static Matrix RotateDeg(float degrees);
  static Matrix RotateDeg(float degrees, float px, float py);

  float GetScaleX() const { return m_[0][0]; }
  float GetScaleY() const { return m_[1][1]; }
  float GetSkewX() const { return m_[1][0]; }
  float GetSkewY() const { return m_[0][1]; }
  float GetTranslateX() const { return m_[2][0]; }
  float GetTranslateY() const { return m_[2][1]; }

  bool IsIdentity() const { return m_ == glm::mat3(1.f); }

  bool IsScaleTranslate() const {
    return m_[1][0] == 0.f && m_[0][1] == 0.f;
  }

  /**
   * this = this * other
   */
  Matrix& PreConcat(const Matrix& other);

  /**
   * this = other * this
   */
  Matrix& PostConcat(const Matrix& other);

  Matrix& PreTranslate(float dx, float dy);
  Matrix& PreScale(float sx, float sy);

  Vec2 MapPoint(const Vec2& point) const;

  void MapPoints(Vec2 dst[], const Vec2 src[], int count) const;

  /**
   * Maps the four corners of src and stores their bounding box into dst.
   */
  void MapRect(Rect* dst, const Rect& src) const;

  Rect MapRect(const Rect& src) const {
    Rect dst;
    MapRect(&dst, src);
    return dst;
  }

  /**
   * @return false if this matrix is not invertible, inverse is untouched.
   */
  bool Invert(Matrix* inverse) const;

  const glm::mat3& ToGLM() const { return m_; }

  friend Matrix operator*(const Matrix& a, const Matrix& b) {
    return Matrix{a.m_ * b.m_};
  }

  bool operator==(const Matrix& other) const { return m_ == other.m_; }
  bool operator!=(const Matrix& other) const { return !(*this == other); }

 private:
  glm::mat3 m_;
};

}  // namespace frost

#endif  // INCLUDE_FROST_GEOMETRY_MATRIX_HPP
