// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include <cstdio>
#include <fstream>
#include <frost/blur/blur_controller.hpp>
#include <frost/blur/pre_draw_dispatcher.hpp>
#include <frost/codec/png_codec.hpp>
#include <frost/render/bitmap_canvas.hpp>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "example/common/box_blur.hpp"

using namespace frost;

namespace {

constexpr int32_t kWindowWidth = 480;
constexpr int32_t kWindowHeight = 360;

/**
 * Window content: diagonal stripes with a few colored squares on top.
 */
class StripedBackground : public BlurTarget {
 public:
  int32_t GetWidth() const override { return kWindowWidth; }
  int32_t GetHeight() const override { return kWindowHeight; }

  IPoint GetLocationOnScreen() const override { return IPoint{0, 0}; }

  void Draw(Canvas* canvas) override {
    canvas->DrawColor(Color_WHITE);

    Paint paint;
    paint.SetColor(Color_DKGRAY);
    for (int32_t i = -kWindowHeight; i < kWindowWidth; i += 32) {
      int save_count = canvas->Save();
      canvas->Translate(static_cast<float>(i), 0.f);
      canvas->Rotate(-30.f);
      canvas->DrawRect(Rect::MakeXYWH(0.f, -400.f, 12.f, 1200.f), paint);
      canvas->RestoreToCount(save_count);
    }

    paint.SetColor(Color_RED);
    canvas->DrawRect(Rect::MakeXYWH(60.f, 60.f, 120.f, 120.f), paint);
    paint.SetColor(Color_BLUE);
    canvas->DrawRect(Rect::MakeXYWH(300.f, 180.f, 120.f, 120.f), paint);
  }
};

/**
 * A floating panel, the surface showing the frosted glass.
 */
class Panel : public BlurHost {
 public:
  Panel(PreDrawDispatcher* dispatcher, const Rect& frame)
      : dispatcher_(dispatcher), frame_(frame) {}

  int32_t GetWidth() const override {
    return static_cast<int32_t>(frame_.Width());
  }
  int32_t GetHeight() const override {
    return static_cast<int32_t>(frame_.Height());
  }
  int32_t GetMeasuredWidth() const override { return GetWidth(); }
  int32_t GetMeasuredHeight() const override { return GetHeight(); }

  IPoint GetLocationOnScreen() const override {
    return IPoint{static_cast<int32_t>(frame_.Left()),
                  static_cast<int32_t>(frame_.Top())};
  }

  // only one frame is rendered, nothing to schedule
  void Invalidate() override {}

  void SetWillNotDraw(bool will_not_draw) override {
    will_not_draw_ = will_not_draw;
  }

  PreDrawDispatcher* GetPreDrawDispatcher() override { return dispatcher_; }

  const Rect& GetFrame() const { return frame_; }
  bool WillNotDraw() const { return will_not_draw_; }

 private:
  PreDrawDispatcher* dispatcher_;
  Rect frame_;
  bool will_not_draw_ = false;
};

std::shared_ptr<Bitmap> MakeNoiseTile() {
  auto tile = Bitmap::Make(64, 64);
  std::mt19937 rng(7);
  std::uniform_int_distribution<uint32_t> dist(0, 255);
  for (uint32_t y = 0; y < tile->Height(); y++) {
    for (uint32_t x = 0; x < tile->Width(); x++) {
      auto v = static_cast<uint8_t>(dist(rng));
      tile->SetPixel(x, y, ColorSetRGB(v, v, v));
    }
  }
  return tile;
}

bool WritePNG(const Bitmap& bitmap, const std::string& path) {
  std::vector<uint8_t> data = PNGCodec::Encode(bitmap);
  if (data.empty()) {
    std::fprintf(stderr, "failed to encode %s\n", path.c_str());
    return false;
  }

  std::ofstream file(path, std::ios::binary);
  if (!file) {
    std::fprintf(stderr, "failed to open %s\n", path.c_str());
    return false;
  }
  file.write(reinterpret_cast<const char*>(data.data()),
             static_cast<std::streamsize>(data.size()));
  return static_cast<bool>(file);
}

}  // namespace

int main(int argc, const char** argv) {
  std::string output = argc > 1 ? argv[1] : "frosted_panel.png";

  PreDrawDispatcher dispatcher;
  StripedBackground background;
  Panel panel(&dispatcher, Rect::MakeXYWH(120.f, 90.f, 240.f, 180.f));

  BlurControllerDescriptor desc;
  desc.host = &panel;
  desc.target = &background;
  desc.blur_algorithm = std::make_shared<example::BoxBlur>();
  desc.overlay_color = ColorSetARGB(0x40, 0xFF, 0xFF, 0xFF);
  desc.noise = std::make_shared<TiledNoiseOverlay>(MakeNoiseTile());

  auto controller = BlurController::Make(desc);
  if (!controller) {
    std::fprintf(stderr, "failed to create blur controller\n");
    return 1;
  }

  controller->SetBlurRadius(6.f)
      ->SetBlurGradient(GradientDirection::kTopToBottom)
      ->SetOverlayGradientColor(ColorSetARGB(0x60, 0xFF, 0xFF, 0xFF),
                                Color_TRANSPARENT,
                                GradientDirection::kTopToBottom);

  // one frame: pre-draw, then the window content, then the panel on top
  auto frame = Bitmap::Make(kWindowWidth, kWindowHeight);
  BitmapCanvas canvas(frame);

  if (!dispatcher.DispatchPreDraw()) {
    std::fprintf(stderr, "draw pass cancelled\n");
    return 1;
  }

  background.Draw(&canvas);

  if (!panel.WillNotDraw()) {
    const Rect& bounds = panel.GetFrame();
    int save_count = canvas.Save();
    canvas.Translate(bounds.Left(), bounds.Top());
    if (!controller->Draw(&canvas)) {
      canvas.DrawColor(Color_LTGRAY);
    }
    canvas.RestoreToCount(save_count);
  }

  controller->Destroy();

  if (!WritePNG(*frame, output)) {
    return 1;
  }

  std::printf("wrote %s\n", output.c_str());
  return 0;
}
