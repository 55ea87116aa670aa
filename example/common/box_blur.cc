// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include "example/common/box_blur.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace frost {
namespace example {

namespace {

// Channels are blurred premultiplied so transparent pixels do not bleed
// their color into the neighbors.
struct Premul {
  float a = 0.f;
  float r = 0.f;
  float g = 0.f;
  float b = 0.f;
};

Premul Load(Color c) {
  float a = ColorGetA(c) / 255.f;
  return Premul{a, ColorGetR(c) / 255.f * a, ColorGetG(c) / 255.f * a,
                ColorGetB(c) / 255.f * a};
}

Color Store(const Premul& p) {
  if (p.a <= 0.f) {
    return Color_TRANSPARENT;
  }
  auto channel = [&p](float v) {
    return static_cast<uint8_t>(
        std::lround(std::clamp(v / p.a, 0.f, 1.f) * 255.f));
  };
  return ColorSetARGB(
      static_cast<uint8_t>(std::lround(std::clamp(p.a, 0.f, 1.f) * 255.f)),
      channel(p.r), channel(p.g), channel(p.b));
}

// One pass of a sliding window average over count pixels spaced by stride.
void BlurLine(Color* pixels, int32_t count, int32_t stride, int32_t radius,
              std::vector<Premul>* scratch) {
  scratch->resize(count);
  for (int32_t i = 0; i < count; i++) {
    (*scratch)[i] = Load(pixels[i * stride]);
  }

  auto at = [&](int32_t i) -> const Premul& {
    return (*scratch)[std::clamp(i, 0, count - 1)];
  };

  Premul sum;
  for (int32_t i = -radius; i <= radius; i++) {
    const Premul& p = at(i);
    sum.a += p.a;
    sum.r += p.r;
    sum.g += p.g;
    sum.b += p.b;
  }

  float inv = 1.f / static_cast<float>(radius * 2 + 1);
  for (int32_t i = 0; i < count; i++) {
    pixels[i * stride] =
        Store(Premul{sum.a * inv, sum.r * inv, sum.g * inv, sum.b * inv});

    const Premul& out = at(i - radius);
    const Premul& in = at(i + radius + 1);
    sum.a += in.a - out.a;
    sum.r += in.r - out.r;
    sum.g += in.g - out.g;
    sum.b += in.b - out.b;
  }
}

}  // namespace

std::shared_ptr<Bitmap> BoxBlur::Blur(std::shared_ptr<Bitmap> bitmap,
                                      float radius) {
  blur_count_++;

  if (!bitmap || destroyed_ || !(radius >= 0.5f)) {
    return bitmap;
  }

  int32_t width = static_cast<int32_t>(bitmap->Width());
  int32_t height = static_cast<int32_t>(bitmap->Height());

  // a window wider than the bitmap only adds clamped edge pixels
  float max_radius = static_cast<float>(std::max(width, height));
  int32_t r = static_cast<int32_t>(std::lround(std::min(radius, max_radius)));
  Color* pixels = bitmap->Pixels();

  std::vector<Premul> scratch;
  for (int32_t y = 0; y < height; y++) {
    BlurLine(pixels + y * width, width, 1, r, &scratch);
  }
  for (int32_t x = 0; x < width; x++) {
    BlurLine(pixels + x, height, width, r, &scratch);
  }

  return bitmap;
}

}  // namespace example
}  // namespace frost
