// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include <frost/graphic/bitmap.hpp>
#include <frost/graphic/color.hpp>

#include "gtest/gtest.h"

TEST(Color, Components) {
  frost::Color color = frost::ColorSetARGB(0x11, 0x22, 0x33, 0x44);

  EXPECT_EQ(color, 0x11223344u);
  EXPECT_EQ(frost::ColorGetA(color), 0x11);
  EXPECT_EQ(frost::ColorGetR(color), 0x22);
  EXPECT_EQ(frost::ColorGetG(color), 0x33);
  EXPECT_EQ(frost::ColorGetB(color), 0x44);

  EXPECT_EQ(frost::ColorSetA(color, 0xFF), 0xFF223344u);
  EXPECT_EQ(frost::ColorSetRGB(0xFF, 0, 0), frost::Color_RED);
}

TEST(Color, Color4fConversion) {
  frost::Color4f c = frost::Color4fFromColor(frost::Color_RED);
  EXPECT_FLOAT_EQ(c.r, 1.f);
  EXPECT_FLOAT_EQ(c.g, 0.f);
  EXPECT_FLOAT_EQ(c.b, 0.f);
  EXPECT_FLOAT_EQ(c.a, 1.f);

  frost::Color gray = frost::ColorSetARGB(0x80, 0x40, 0x40, 0x40);
  EXPECT_EQ(frost::Color4fToColor(frost::Color4fFromColor(gray)), gray);

  // out of range values are clamped
  EXPECT_EQ(frost::Color4fToColor(frost::Color4f{2.f, -1.f, 0.f, 1.f}),
            frost::Color_RED);
}

TEST(Bitmap, MakeRejectsEmptySize) {
  EXPECT_EQ(frost::Bitmap::Make(0, 10), nullptr);
  EXPECT_EQ(frost::Bitmap::Make(10, 0), nullptr);

  auto bitmap = frost::Bitmap::Make(3, 2);
  ASSERT_NE(bitmap, nullptr);
  EXPECT_EQ(bitmap->Width(), 3u);
  EXPECT_EQ(bitmap->Height(), 2u);
  EXPECT_EQ(bitmap->RowBytes(), 12u);
  EXPECT_EQ(bitmap->Size().width, 3);
  EXPECT_EQ(bitmap->Size().height, 2);
}

TEST(Bitmap, StartsTransparent) {
  auto bitmap = frost::Bitmap::Make(4, 4);
  for (uint32_t i = 0; i < 16; i++) {
    EXPECT_EQ(bitmap->Pixels()[i], frost::Color_TRANSPARENT);
  }
}

TEST(Bitmap, PixelAccess) {
  auto bitmap = frost::Bitmap::Make(3, 2);
  bitmap->EraseColor(frost::Color_BLUE);
  bitmap->SetPixel(2, 1, frost::Color_RED);

  EXPECT_EQ(bitmap->GetPixel(0, 0), frost::Color_BLUE);
  EXPECT_EQ(bitmap->GetPixel(2, 1), frost::Color_RED);
  EXPECT_EQ(bitmap->Pixels()[5], frost::Color_RED);

  // out of bounds reads are transparent and writes are dropped
  EXPECT_EQ(bitmap->GetPixel(3, 0), frost::Color_TRANSPARENT);
  bitmap->SetPixel(0, 2, frost::Color_GREEN);
  EXPECT_EQ(bitmap->GetPixel(0, 1), frost::Color_BLUE);
}
