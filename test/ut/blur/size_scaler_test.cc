// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include "src/blur/size_scaler.hpp"

#include "gtest/gtest.h"

TEST(SizeScaler, DividesAndRounds) {
  frost::SizeScaler scaler(4.f);

  auto size = scaler.Scale(200, 100);
  EXPECT_EQ(size.width, 50);
  EXPECT_EQ(size.height, 25);
  EXPECT_EQ(size.scale_factor_w, 4.f);
  EXPECT_EQ(size.scale_factor_h, 4.f);

  // 101 / 4 = 25.25, 102 / 4 = 25.5
  size = scaler.Scale(101, 102);
  EXPECT_EQ(size.width, 25);
  EXPECT_EQ(size.height, 26);
}

TEST(SizeScaler, PerAxisFactorsFollowRounding) {
  frost::SizeScaler scaler(4.f);

  auto size = scaler.Scale(102, 101);
  EXPECT_FLOAT_EQ(size.scale_factor_w, 102.f / 26.f);
  EXPECT_FLOAT_EQ(size.scale_factor_h, 101.f / 25.f);
}

TEST(SizeScaler, NeverScalesToZero) {
  frost::SizeScaler scaler(8.f);

  auto size = scaler.Scale(3, 1);
  EXPECT_EQ(size.width, 1);
  EXPECT_EQ(size.height, 1);
  EXPECT_EQ(size.Size(), (frost::ISize{1, 1}));
}

TEST(SizeScaler, ZeroSized) {
  frost::SizeScaler scaler(4.f);
  EXPECT_FALSE(scaler.IsZeroSized(200, 100));
  EXPECT_TRUE(scaler.IsZeroSized(0, 100));
  EXPECT_TRUE(scaler.IsZeroSized(200, 0));
  EXPECT_TRUE(scaler.IsZeroSized(-1, 100));

  frost::SizeScaler identity(1.f);
  EXPECT_TRUE(identity.IsZeroSized(200, 100));
}

TEST(SizeScaler, FactorBelowOneIsClamped) {
  frost::SizeScaler scaler(0.5f);
  EXPECT_EQ(scaler.GetScaleFactor(), 1.f);
  EXPECT_EQ(scaler.Scale(30, 20).Size(), (frost::ISize{30, 20}));
}
