// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include "src/blur/render_node_blur_controller.hpp"

#include <frost/effect/render_effect.hpp>
#include <frost/render/bitmap_canvas.hpp>
#include <memory>

#include "gtest/gtest.h"
#include "test/ut/blur/blur_test_helpers.hpp"

using frost::test::FakeHost;
using frost::test::FakeTarget;
using frost::test::HardwareCanvas;
using frost::test::RecordingBlurAlgorithm;

namespace {

class RenderNodeBlurControllerTest : public ::testing::Test {
 protected:
  RenderNodeBlurControllerTest() : host_(200, 100), target_(400, 300) {
    host_.SetSupportsRenderEffects(true);
    host_.SetLocation(frost::IPoint{50, 60});
    target_.SetHasRenderNode(true);

    // blue left of x = 150, green right of it
    frost::RenderNode* node = target_.Node();
    node->SetPosition(frost::Rect::MakeWH(400.f, 300.f));
    frost::RecordingCanvas* canvas = node->BeginRecording();
    frost::Paint paint;
    paint.SetColor(frost::Color_BLUE);
    canvas->DrawRect(frost::Rect::MakeXYWH(0.f, 0.f, 150.f, 300.f), paint);
    paint.SetColor(frost::Color_GREEN);
    canvas->DrawRect(frost::Rect::MakeXYWH(150.f, 0.f, 250.f, 300.f), paint);
    node->EndRecording();
  }

  frost::BlurControllerDescriptor Descriptor() {
    frost::BlurControllerDescriptor desc;
    desc.host = &host_;
    desc.target = &target_;
    return desc;
  }

  FakeHost host_;
  FakeTarget target_;
};

}  // namespace

TEST_F(RenderNodeBlurControllerTest, SubscribesOnConstruction) {
  frost::RenderNodeBlurController controller(Descriptor());

  EXPECT_FALSE(host_.WillNotDraw());
  EXPECT_TRUE(controller.IsAutoUpdating());
  EXPECT_EQ(host_.Dispatcher()->ListenerCount(), 1u);
}

TEST_F(RenderNodeBlurControllerTest, HardwareDrawSetsUpBlurNode) {
  frost::RenderNodeBlurController controller(Descriptor());
  HardwareCanvas canvas;

  EXPECT_TRUE(controller.Draw(&canvas));
  EXPECT_GT(canvas.RecordedOpCount(), 0u);

  const frost::RenderNode* node = controller.GetBlurNode();
  // the node covers the whole target, not just the part behind the host
  EXPECT_EQ(node->GetPosition(), frost::Rect::MakeWH(400.f, 300.f));
  EXPECT_EQ(node->GetTranslationX(), -50.f);
  EXPECT_EQ(node->GetTranslationY(), -60.f);
  EXPECT_EQ(node->GetPivotX(), 150.f);
  EXPECT_EQ(node->GetPivotY(), 110.f);
  EXPECT_TRUE(node->HasDisplayList());
  EXPECT_FALSE(node->IsRecording());

  const auto& effect = node->GetRenderEffect();
  ASSERT_NE(effect, nullptr);
  EXPECT_EQ(effect->GetType(), frost::RenderEffect::Type::kBlur);
  EXPECT_EQ(effect->GetRadiusX(), 64.f);
  EXPECT_EQ(effect->GetRadiusY(), 64.f);
  EXPECT_EQ(effect->GetEdgeMode(), frost::TileMode::kClamp);
}

TEST_F(RenderNodeBlurControllerTest, PlaybackShowsContentBehindHost) {
  frost::RenderNodeBlurController controller(Descriptor());
  HardwareCanvas canvas;
  ASSERT_TRUE(controller.Draw(&canvas));
  auto display_list = canvas.FinishRecording();

  // the backend would blur here, software playback only checks placement
  auto bitmap = frost::Bitmap::Make(300, 200);
  frost::BitmapCanvas playback(bitmap);
  display_list->Draw(&playback);

  // host x in [0, 100) is target x in [50, 150)
  EXPECT_EQ(bitmap->GetPixel(10, 10), frost::Color_BLUE);
  EXPECT_EQ(bitmap->GetPixel(150, 10), frost::Color_GREEN);
  // clipped to the host
  EXPECT_EQ(bitmap->GetPixel(250, 10), frost::Color_TRANSPARENT);
  EXPECT_EQ(bitmap->GetPixel(10, 150), frost::Color_TRANSPARENT);
}

TEST_F(RenderNodeBlurControllerTest, OverlayIsDrawnOverTheNode) {
  auto desc = Descriptor();
  desc.overlay_color = frost::Color_WHITE;
  frost::RenderNodeBlurController controller(desc);

  HardwareCanvas canvas;
  ASSERT_TRUE(controller.Draw(&canvas));
  auto display_list = canvas.FinishRecording();

  auto bitmap = frost::Bitmap::Make(200, 100);
  frost::BitmapCanvas playback(bitmap);
  display_list->Draw(&playback);

  EXPECT_EQ(bitmap->GetPixel(10, 10), frost::Color_WHITE);
}

TEST_F(RenderNodeBlurControllerTest, RadiusIsScaledAndAppliedRightAway) {
  frost::RenderNodeBlurController controller(Descriptor());
  auto generation = controller.GetBlurNode()->GetRenderEffectGeneration();

  controller.SetBlurRadius(10.f);
  const auto& effect = controller.GetBlurNode()->GetRenderEffect();
  ASSERT_NE(effect, nullptr);
  EXPECT_EQ(effect->GetRadiusX(), 40.f);
  EXPECT_EQ(controller.GetBlurNode()->GetRenderEffectGeneration(),
            generation + 1);

  // unchanged radius is a no-op
  controller.SetBlurRadius(10.f);
  EXPECT_EQ(controller.GetBlurNode()->GetRenderEffectGeneration(),
            generation + 1);

  controller.SetBlurRadius(-1.f);
  EXPECT_EQ(controller.GetBlurRadius(), 0.f);
  EXPECT_EQ(controller.GetBlurNode()->GetRenderEffect()->GetRadiusX(), 0.f);
}

TEST_F(RenderNodeBlurControllerTest, BlurGradientBlendsMaskIntoEffect) {
  host_.Resize(100, 200);
  frost::RenderNodeBlurController controller(Descriptor());
  host_.Dispatcher()->DispatchPreDraw();

  controller.SetBlurGradient(frost::GradientDirection::kTopToBottom);
  EXPECT_EQ(host_.InvalidateCount(), 1);

  const auto& effect = controller.GetBlurNode()->GetRenderEffect();
  ASSERT_NE(effect, nullptr);
  ASSERT_EQ(effect->GetType(), frost::RenderEffect::Type::kBlend);
  EXPECT_EQ(effect->GetBlendMode(), frost::BlendMode::kDstIn);

  const auto& inputs = effect->GetInputs();
  ASSERT_EQ(inputs.size(), 2u);
  EXPECT_EQ(inputs[0]->GetType(), frost::RenderEffect::Type::kBlur);
  ASSERT_EQ(inputs[1]->GetType(), frost::RenderEffect::Type::kShader);

  frost::Shader::GradientInfo info;
  ASSERT_EQ(inputs[1]->GetShader()->AsGradient(&info),
            frost::Shader::kLinear);
  EXPECT_EQ(info.points[0], (frost::Vec2{0.f, 60.f}));
  EXPECT_EQ(info.points[1], (frost::Vec2{0.f, 260.f}));
  ASSERT_EQ(info.colors.size(), 2u);
  EXPECT_EQ(info.colors[0].a, 1.f);
  EXPECT_EQ(info.colors[1].a, 0.f);
  EXPECT_TRUE(controller.GetGradientMaskCache().HasCachedShader());

  controller.SetBlurGradient(frost::GradientDirection::kNone);
  EXPECT_FALSE(controller.GetGradientMaskCache().HasCachedShader());
  EXPECT_EQ(controller.GetBlurNode()->GetRenderEffect()->GetType(),
            frost::RenderEffect::Type::kBlur);
}

TEST_F(RenderNodeBlurControllerTest, BlurGradientNeedsHostSize) {
  host_.Resize(0, 0);
  frost::RenderNodeBlurController controller(Descriptor());

  controller.SetBlurGradient(frost::GradientDirection::kLeftToRight);
  EXPECT_EQ(controller.GetBlurNode()->GetRenderEffect()->GetType(),
            frost::RenderEffect::Type::kBlur);
}

TEST_F(RenderNodeBlurControllerTest, PreDrawFollowsHostPosition) {
  frost::RenderNodeBlurController controller(Descriptor());
  auto generation = controller.GetBlurNode()->GetRenderEffectGeneration();

  host_.SetLocation(frost::IPoint{10, 20});
  target_.SetLocation(frost::IPoint{0, 5});
  host_.Dispatcher()->DispatchPreDraw();

  const frost::RenderNode* node = controller.GetBlurNode();
  EXPECT_EQ(node->GetTranslationX(), -10.f);
  EXPECT_EQ(node->GetTranslationY(), -15.f);
  EXPECT_EQ(node->GetPivotX(), 110.f);
  EXPECT_EQ(node->GetPivotY(), 65.f);

  // the effect is left alone without the reapply workaround
  EXPECT_EQ(node->GetRenderEffectGeneration(), generation);
}

TEST_F(RenderNodeBlurControllerTest, ReapplyEffectOnTransformChange) {
  auto desc = Descriptor();
  desc.reapply_effect_on_transform_change = true;
  frost::RenderNodeBlurController controller(desc);
  auto generation = controller.GetBlurNode()->GetRenderEffectGeneration();

  host_.Dispatcher()->DispatchPreDraw();
  EXPECT_EQ(controller.GetBlurNode()->GetRenderEffectGeneration(),
            generation + 1);

  controller.UpdateRotation(15.f);
  EXPECT_EQ(controller.GetBlurNode()->GetRenderEffectGeneration(),
            generation + 2);
}

TEST_F(RenderNodeBlurControllerTest, HostTransformIsCountered) {
  frost::RenderNodeBlurController controller(Descriptor());
  const frost::RenderNode* node = controller.GetBlurNode();

  controller.UpdateRotation(30.f);
  EXPECT_EQ(node->GetRotationZ(), -30.f);

  controller.UpdateScaleX(2.f);
  controller.UpdateScaleY(0.5f);
  EXPECT_EQ(node->GetScaleX(), 0.5f);
  EXPECT_EQ(node->GetScaleY(), 2.f);

  controller.UpdateScaleX(0.f);
  EXPECT_EQ(node->GetScaleX(), 0.5f);
}

TEST_F(RenderNodeBlurControllerTest, DrawIntoCaptureCanvasIsRefused) {
  frost::RenderNodeBlurController controller(Descriptor());

  frost::BlurCaptureCanvas capture(frost::Bitmap::Make(10, 10));
  EXPECT_FALSE(controller.Draw(&capture));
}

TEST_F(RenderNodeBlurControllerTest, SoftwareDrawUsesFallbackAlgorithm) {
  auto algorithm = std::make_shared<RecordingBlurAlgorithm>();
  int factory_calls = 0;

  auto desc = Descriptor();
  desc.fallback_algorithm_factory = [&]() {
    factory_calls++;
    return algorithm;
  };
  target_.SetColor(frost::Color_RED);
  frost::RenderNodeBlurController controller(desc);

  // gradients are skipped on the software path
  controller.SetOverlayGradientColor(frost::Color_GREEN, frost::Color_GREEN,
                                     frost::GradientDirection::kTopToBottom);

  auto bitmap = frost::Bitmap::Make(200, 100);
  frost::BitmapCanvas canvas(bitmap);

  EXPECT_TRUE(controller.Draw(&canvas));
  EXPECT_TRUE(controller.Draw(&canvas));

  EXPECT_EQ(factory_calls, 1);
  EXPECT_EQ(algorithm->BlurCount(), 2);
  EXPECT_EQ(algorithm->LastRadius(), frost::kDefaultBlurRadius);

  const auto& snapshot = controller.GetSoftwareSnapshot();
  ASSERT_NE(snapshot, nullptr);
  EXPECT_EQ(snapshot->Width(), 50u);
  EXPECT_EQ(snapshot->Height(), 25u);

  EXPECT_EQ(bitmap->GetPixel(100, 50), frost::Color_RED);
  EXPECT_EQ(target_.DrawCount(), 2);
}

TEST_F(RenderNodeBlurControllerTest, SoftwareDrawWithoutFallback) {
  target_.SetColor(frost::Color_RED);
  auto desc = Descriptor();
  desc.overlay_color = frost::ColorSetARGB(0xFF, 0, 0, 0x80);
  frost::RenderNodeBlurController controller(desc);

  auto bitmap = frost::Bitmap::Make(200, 100);
  frost::BitmapCanvas canvas(bitmap);

  EXPECT_TRUE(controller.Draw(&canvas));
  EXPECT_EQ(bitmap->GetPixel(100, 50), frost::ColorSetARGB(0xFF, 0, 0, 0x80));

  controller.SetOverlayColor(frost::Color_TRANSPARENT);
  EXPECT_TRUE(controller.Draw(&canvas));
  EXPECT_EQ(bitmap->GetPixel(100, 50), frost::Color_RED);
}

TEST_F(RenderNodeBlurControllerTest, DisabledBlurDoesNotDraw) {
  frost::RenderNodeBlurController controller(Descriptor());
  HardwareCanvas canvas;

  controller.SetBlurEnabled(false);
  EXPECT_EQ(host_.InvalidateCount(), 1);
  EXPECT_FALSE(controller.Draw(&canvas));
  EXPECT_EQ(canvas.RecordedOpCount(), 0u);

  controller.SetBlurEnabled(false);
  EXPECT_EQ(host_.InvalidateCount(), 1);
}

TEST_F(RenderNodeBlurControllerTest, DestroyReleasesResources) {
  auto algorithm = std::make_shared<RecordingBlurAlgorithm>();
  auto desc = Descriptor();
  desc.fallback_algorithm_factory = [algorithm]() { return algorithm; };
  frost::RenderNodeBlurController controller(desc);

  auto bitmap = frost::Bitmap::Make(200, 100);
  frost::BitmapCanvas canvas(bitmap);
  ASSERT_TRUE(controller.Draw(&canvas));
  HardwareCanvas hw_canvas;
  ASSERT_TRUE(controller.Draw(&hw_canvas));

  controller.Destroy();
  EXPECT_TRUE(controller.IsDestroyed());
  EXPECT_EQ(host_.Dispatcher()->ListenerCount(), 0u);
  EXPECT_EQ(algorithm->DestroyCount(), 1);
  EXPECT_FALSE(controller.GetBlurNode()->HasDisplayList());
  EXPECT_EQ(controller.GetSoftwareSnapshot(), nullptr);
  EXPECT_FALSE(controller.Draw(&canvas));

  controller.Destroy();
  EXPECT_EQ(algorithm->DestroyCount(), 1);
}

TEST_F(RenderNodeBlurControllerTest, UpdateSizeIsANoOp) {
  frost::RenderNodeBlurController controller(Descriptor());
  HardwareCanvas canvas;
  ASSERT_TRUE(controller.Draw(&canvas));
  auto position = controller.GetBlurNode()->GetPosition();

  host_.Resize(20, 20);
  controller.UpdateSize();
  EXPECT_EQ(controller.GetBlurNode()->GetPosition(), position);
}
