// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include <algorithm>
#include <array>
#include <cmath>
#include <frost/geometry/matrix.hpp>
#include <glm/gtc/constants.hpp>

namespace frost {

namespace {

constexpr float kNearlyZero = 1.f / (1 << 12);

}  // namespace

Matrix Matrix::Translate(float dx, float dy) {
  glm::mat3 m{1.f};
  m[2][0] = dx;
  m[2][1] = dy;
  return Matrix{m};
}

Matrix Matrix::Scale(float sx, float sy) {
  glm::mat3 m{1.f};
  m[0][0] = sx;
  m[1][1] = sy;
  return Matrix{m};
}

Matrix Matrix::RotateDeg(float degrees) {
  float radians = degrees * glm::pi<float>() / 180.f;
  float s = std::sin(radians);
  float c = std::cos(radians);

  // snap values that should be exact for the common right angles
  if (std::abs(s) < kNearlyZero) {
    s = 0.f;
  }
  if (std::abs(c) < kNearlyZero) {
    c = 0.f;
  }

  glm::mat3 m{1.f};
  m[0][0] = c;
  m[0][1] = s;
  m[1][0] = -s;
  m[1][1] = c;
  return Matrix{m};
}

Matrix Matrix::RotateDeg(float degrees, float px, float py) {
  return Translate(px, py) * RotateDeg(degrees) * Translate(-px, -py);
}

Matrix& Matrix::PreConcat(const Matrix& other) {
  m_ = m_ * other.m_;
  return *this;
}

Matrix& Matrix::PostConcat(const Matrix& other) {
  m_ = other.m_ * m_;
  return *this;
}

Matrix& Matrix::PreTranslate(float dx, float dy) {
  return PreConcat(Translate(dx, dy));
}

Matrix& Matrix::PreScale(float sx, float sy) {
  return PreConcat(Scale(sx, sy));
}

Vec2 Matrix::MapPoint(const Vec2& point) const {
  glm::vec3 p = m_ * glm::vec3{point.x, point.y, 1.f};
  return Vec2{p.x, p.y};
}

void Matrix::MapPoints(Vec2 dst[], const Vec2 src[], int count) const {
  for (int i = 0; i < count; i++) {
    dst[i] = MapPoint(src[i]);
  }
}

void Matrix::MapRect(Rect* dst, const Rect& src) const {
  if (IsScaleTranslate()) {
    Vec2 p0 = MapPoint({src.Left(), src.Top()});
    Vec2 p1 = MapPoint({src.Right(), src.Bottom()});
    dst->SetLTRB(std::min(p0.x, p1.x), std::min(p0.y, p1.y),
                 std::max(p0.x, p1.x), std::max(p0.y, p1.y));
    return;
  }

  std::array<Vec2, 4> corners = {
      Vec2{src.Left(), src.Top()},
      Vec2{src.Right(), src.Top()},
      Vec2{src.Right(), src.Bottom()},
      Vec2{src.Left(), src.Bottom()},
  };
  MapPoints(corners.data(), corners.data(), 4);

  float l = corners[0].x;
  float t = corners[0].y;
  float r = corners[0].x;
  float b = corners[0].y;
  for (size_t i = 1; i < corners.size(); i++) {
    l = std::min(l, corners[i].x);
    t = std::min(t, corners[i].y);
    r = std::max(r, corners[i].x);
    b = std::max(b, corners[i].y);
  }
  dst->SetLTRB(l, t, r, b);
}

bool Matrix::Invert(Matrix* inverse) const {
  float det = glm::determinant(m_);
  if (std::abs(det) < kNearlyZero * kNearlyZero * kNearlyZero ||
      !std::isfinite(det)) {
    return false;
  }

  if (inverse) {
    inverse->m_ = glm::inverse(m_);
  }
  return true;
}

}  // namespace frost
