// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include <frost/blur/blur_controller.hpp>
#include <memory>

#include "gtest/gtest.h"
#include "src/blur/render_node_blur_controller.hpp"
#include "src/blur/snapshot_blur_controller.hpp"
#include "test/ut/blur/blur_test_helpers.hpp"

using frost::test::FakeHost;
using frost::test::FakeTarget;
using frost::test::RecordingBlurAlgorithm;

TEST(BlurController, MakeNeedsHostAndTarget) {
  FakeHost host(100, 100);
  FakeTarget target(100, 100);

  frost::BlurControllerDescriptor desc;
  desc.blur_algorithm = std::make_shared<RecordingBlurAlgorithm>();
  EXPECT_EQ(frost::BlurController::Make(desc), nullptr);

  desc.host = &host;
  EXPECT_EQ(frost::BlurController::Make(desc), nullptr);

  desc.host = nullptr;
  desc.target = &target;
  EXPECT_EQ(frost::BlurController::Make(desc), nullptr);
}

TEST(BlurController, MakePicksRenderNodeStrategy) {
  FakeHost host(100, 100);
  FakeTarget target(100, 100);
  host.SetSupportsRenderEffects(true);
  target.SetHasRenderNode(true);

  frost::BlurControllerDescriptor desc;
  desc.host = &host;
  desc.target = &target;

  // no algorithm needed on this path
  auto controller = frost::BlurController::Make(desc);
  ASSERT_NE(controller, nullptr);
  EXPECT_NE(dynamic_cast<frost::RenderNodeBlurController*>(controller.get()),
            nullptr);
}

TEST(BlurController, MakeFallsBackToSnapshotStrategy) {
  FakeHost host(100, 100);
  FakeTarget target(100, 100);

  frost::BlurControllerDescriptor desc;
  desc.host = &host;
  desc.target = &target;
  desc.blur_algorithm = std::make_shared<RecordingBlurAlgorithm>();

  // render effects without a target node are not enough
  host.SetSupportsRenderEffects(true);
  auto controller = frost::BlurController::Make(desc);
  ASSERT_NE(controller, nullptr);
  EXPECT_NE(dynamic_cast<frost::SnapshotBlurController*>(controller.get()),
            nullptr);

  host.SetSupportsRenderEffects(false);
  target.SetHasRenderNode(true);
  controller = frost::BlurController::Make(desc);
  ASSERT_NE(controller, nullptr);
  EXPECT_NE(dynamic_cast<frost::SnapshotBlurController*>(controller.get()),
            nullptr);
}

TEST(BlurController, SnapshotStrategyNeedsAlgorithm) {
  FakeHost host(100, 100);
  FakeTarget target(100, 100);

  frost::BlurControllerDescriptor desc;
  desc.host = &host;
  desc.target = &target;
  EXPECT_EQ(frost::BlurController::Make(desc), nullptr);
}

TEST(BlurController, SettersChain) {
  FakeHost host(100, 100);
  FakeTarget target(100, 100);

  frost::BlurControllerDescriptor desc;
  desc.host = &host;
  desc.target = &target;
  desc.blur_algorithm = std::make_shared<RecordingBlurAlgorithm>();
  auto controller = frost::BlurController::Make(desc);
  ASSERT_NE(controller, nullptr);

  frost::BlurController* result =
      controller->SetBlurRadius(8.f)
          ->SetOverlayColor(frost::ColorSetARGB(0x40, 0xFF, 0xFF, 0xFF))
          ->SetBlurGradient(frost::GradientDirection::kBottomToTop)
          ->SetBlurAutoUpdate(true)
          ->SetBlurEnabled(true);
  EXPECT_EQ(result, controller.get());
}
