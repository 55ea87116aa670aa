// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include <frost/log.hpp>
#include <frost/render/bitmap_canvas.hpp>
#include <string>
#include <utility>
#include <vector>

#include "gtest/gtest.h"

class LogTest : public ::testing::Test {
 protected:
  void SetUp() override {
#ifndef FROST_LOG
    GTEST_SKIP() << "frost is built without logging";
#endif
    saved_level_ = frost::GetLogLevel();
    frost::SetLogCallback([this](frost::LogLevel level, const char* message) {
      messages_.emplace_back(level, message);
    });
  }

  void TearDown() override {
    frost::SetLogCallback(nullptr);
    frost::SetLogLevel(saved_level_);
  }

  // Canvas warns about a null bitmap, which gives a cheap way to log.
  void EmitWarning() {
    auto bitmap = frost::Bitmap::Make(1, 1);
    frost::BitmapCanvas canvas(bitmap);
    canvas.DrawBitmap(nullptr, 0.f, 0.f);
  }

  frost::LogLevel saved_level_ = frost::LogLevel::kInfo;
  std::vector<std::pair<frost::LogLevel, std::string>> messages_;
};

TEST_F(LogTest, CallbackReceivesFormattedMessage) {
  frost::SetLogLevel(frost::LogLevel::kInfo);
  EmitWarning();

  ASSERT_EQ(messages_.size(), 1u);
  EXPECT_EQ(messages_[0].first, frost::LogLevel::kWarning);
  EXPECT_EQ(messages_[0].second, "Canvas::DrawBitmap with null bitmap");
}

TEST_F(LogTest, LevelFiltersMessages) {
  frost::SetLogLevel(frost::LogLevel::kError);
  EXPECT_EQ(frost::GetLogLevel(), frost::LogLevel::kError);
  EmitWarning();
  EXPECT_TRUE(messages_.empty());

  frost::SetLogLevel(frost::LogLevel::kDebug);
  EmitWarning();
  EXPECT_EQ(messages_.size(), 1u);
}

TEST_F(LogTest, CallbackMayLogAgain) {
  frost::SetLogLevel(frost::LogLevel::kInfo);
  bool nested = false;
  frost::SetLogCallback([&](frost::LogLevel level, const char* message) {
    messages_.emplace_back(level, message);
    if (!nested) {
      nested = true;
      frost::Bitmap::Make(0, 0);
    }
  });

  EmitWarning();

  ASSERT_EQ(messages_.size(), 2u);
  EXPECT_EQ(messages_[0].second, "Canvas::DrawBitmap with null bitmap");
  EXPECT_EQ(messages_[1].second, "Bitmap::Make with empty size 0x0");
}

TEST_F(LogTest, BitmapErrorsAreReported) {
  EXPECT_EQ(frost::Bitmap::Make(0, 0), nullptr);

  ASSERT_EQ(messages_.size(), 1u);
  EXPECT_EQ(messages_[0].first, frost::LogLevel::kError);
  EXPECT_EQ(messages_[0].second, "Bitmap::Make with empty size 0x0");
}
