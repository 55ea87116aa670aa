// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include <cmath>
#include <frost/geometry/matrix.hpp>

#include "gtest/gtest.h"

TEST(Matrix, DefaultIsIdentity) {
  frost::Matrix matrix;
  EXPECT_TRUE(matrix.IsIdentity());
  EXPECT_TRUE(matrix.IsScaleTranslate());
  EXPECT_EQ(matrix.GetScaleX(), 1.f);
  EXPECT_EQ(matrix.GetTranslateX(), 0.f);
}

TEST(Matrix, TranslateAndScale) {
  auto translate = frost::Matrix::Translate(10.f, 20.f);
  EXPECT_EQ(translate.GetTranslateX(), 10.f);
  EXPECT_EQ(translate.GetTranslateY(), 20.f);

  auto p = translate.MapPoint(frost::Vec2{1.f, 2.f});
  EXPECT_FLOAT_EQ(p.x, 11.f);
  EXPECT_FLOAT_EQ(p.y, 22.f);

  auto scale = frost::Matrix::Scale(2.f, 3.f);
  p = scale.MapPoint(frost::Vec2{1.f, 2.f});
  EXPECT_FLOAT_EQ(p.x, 2.f);
  EXPECT_FLOAT_EQ(p.y, 6.f);
}

TEST(Matrix, PreConcatAppliesOtherFirst) {
  frost::Matrix matrix = frost::Matrix::Translate(10.f, 0.f);
  matrix.PreConcat(frost::Matrix::Scale(2.f, 2.f));

  // scale, then translate
  auto p = matrix.MapPoint(frost::Vec2{1.f, 1.f});
  EXPECT_FLOAT_EQ(p.x, 12.f);
  EXPECT_FLOAT_EQ(p.y, 2.f);

  frost::Matrix post = frost::Matrix::Translate(10.f, 0.f);
  post.PostConcat(frost::Matrix::Scale(2.f, 2.f));

  // translate, then scale
  p = post.MapPoint(frost::Vec2{1.f, 1.f});
  EXPECT_FLOAT_EQ(p.x, 22.f);
  EXPECT_FLOAT_EQ(p.y, 2.f);
}

TEST(Matrix, PreTranslateAndPreScale) {
  frost::Matrix matrix;
  matrix.PreTranslate(5.f, 5.f);
  matrix.PreScale(0.5f, 0.25f);

  auto p = matrix.MapPoint(frost::Vec2{4.f, 4.f});
  EXPECT_FLOAT_EQ(p.x, 7.f);
  EXPECT_FLOAT_EQ(p.y, 6.f);
  EXPECT_TRUE(matrix.IsScaleTranslate());
}

TEST(Matrix, RotateAroundPivot) {
  auto rotate = frost::Matrix::RotateDeg(90.f, 10.f, 10.f);
  EXPECT_FALSE(rotate.IsScaleTranslate());

  auto p = rotate.MapPoint(frost::Vec2{20.f, 10.f});
  EXPECT_NEAR(p.x, 10.f, 1e-4f);
  EXPECT_NEAR(p.y, 20.f, 1e-4f);

  // pivot stays in place
  p = rotate.MapPoint(frost::Vec2{10.f, 10.f});
  EXPECT_NEAR(p.x, 10.f, 1e-4f);
  EXPECT_NEAR(p.y, 10.f, 1e-4f);
}

TEST(Matrix, MapRectReturnsBounds) {
  auto matrix = frost::Matrix::Scale(2.f, 4.f);
  matrix.PostConcat(frost::Matrix::Translate(1.f, 1.f));

  auto rect = matrix.MapRect(frost::Rect::MakeXYWH(1.f, 1.f, 2.f, 2.f));
  EXPECT_FLOAT_EQ(rect.Left(), 3.f);
  EXPECT_FLOAT_EQ(rect.Top(), 5.f);
  EXPECT_FLOAT_EQ(rect.Right(), 7.f);
  EXPECT_FLOAT_EQ(rect.Bottom(), 13.f);

  auto rotated = frost::Matrix::RotateDeg(45.f).MapRect(
      frost::Rect::MakeXYWH(-1.f, -1.f, 2.f, 2.f));
  EXPECT_NEAR(rotated.Width(), 2.f * std::sqrt(2.f), 1e-4f);
  EXPECT_NEAR(rotated.Height(), 2.f * std::sqrt(2.f), 1e-4f);
}

TEST(Matrix, Invert) {
  auto matrix = frost::Matrix::Translate(3.f, -4.f);
  matrix.PreScale(2.f, 0.5f);

  frost::Matrix inverse;
  ASSERT_TRUE(matrix.Invert(&inverse));

  auto p = inverse.MapPoint(matrix.MapPoint(frost::Vec2{7.f, 9.f}));
  EXPECT_NEAR(p.x, 7.f, 1e-4f);
  EXPECT_NEAR(p.y, 9.f, 1e-4f);

  frost::Matrix untouched = frost::Matrix::Translate(1.f, 1.f);
  EXPECT_FALSE(frost::Matrix::Scale(0.f, 1.f).Invert(&untouched));
  EXPECT_EQ(untouched, frost::Matrix::Translate(1.f, 1.f));
}
