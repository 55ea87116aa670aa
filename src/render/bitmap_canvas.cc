// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include <cmath>
#include <frost/render/bitmap_canvas.hpp>
#include <frost/render/render_node.hpp>
#include <glm/glm.hpp>
#include <utility>

#include "src/logging.hpp"

namespace frost {

namespace {

Color4f Premultiply(const Color4f& c) {
  return Color4f{c.r * c.a, c.g * c.a, c.b * c.a, c.a};
}

Color4f Unpremultiply(const Color4f& c) {
  if (c.a <= 0.f) {
    return Color4f{0.f};
  }
  return Color4f{c.r / c.a, c.g / c.a, c.b / c.a, c.a};
}

// s and d are premultiplied
Color4f Blend(const Color4f& s, const Color4f& d, BlendMode mode) {
  switch (mode) {
    case BlendMode::kClear:
      return Color4f{0.f};
    case BlendMode::kSrc:
      return s;
    case BlendMode::kDst:
      return d;
    case BlendMode::kSrcOver:
      return s + d * (1.f - s.a);
    case BlendMode::kDstOver:
      return d + s * (1.f - d.a);
    case BlendMode::kSrcIn:
      return s * d.a;
    case BlendMode::kDstIn:
      return d * s.a;
    case BlendMode::kSrcOut:
      return s * (1.f - d.a);
    case BlendMode::kDstOut:
      return d * (1.f - s.a);
  }
  return s + d * (1.f - s.a);
}

Color4f FetchPremul(const Bitmap& bitmap, int32_t x, int32_t y) {
  x = glm::clamp(x, 0, static_cast<int32_t>(bitmap.Width()) - 1);
  y = glm::clamp(y, 0, static_cast<int32_t>(bitmap.Height()) - 1);
  return Premultiply(Color4fFromColor(
      bitmap.GetPixel(static_cast<uint32_t>(x), static_cast<uint32_t>(y))));
}

// Returns a premultiplied color. u and v are in bitmap pixel units.
Color4f SampleBitmap(const Bitmap& bitmap, float u, float v,
                     FilterMode filter) {
  if (filter == FilterMode::kNearest) {
    return FetchPremul(bitmap, static_cast<int32_t>(std::floor(u)),
                       static_cast<int32_t>(std::floor(v)));
  }

  float fx = u - 0.5f;
  float fy = v - 0.5f;
  float x0 = std::floor(fx);
  float y0 = std::floor(fy);
  float tx = fx - x0;
  float ty = fy - y0;

  auto ix = static_cast<int32_t>(x0);
  auto iy = static_cast<int32_t>(y0);

  Color4f top = glm::mix(FetchPremul(bitmap, ix, iy),
                         FetchPremul(bitmap, ix + 1, iy), tx);
  Color4f bottom = glm::mix(FetchPremul(bitmap, ix, iy + 1),
                            FetchPremul(bitmap, ix + 1, iy + 1), tx);
  return glm::mix(top, bottom, ty);
}

// Walks every device pixel whose center is inside device_bounds and, when
// local_bounds is given, whose local position is inside local_bounds.
// shade receives the local position and returns a premultiplied source color.
template <typename Shade>
void FillPixels(Bitmap* bitmap, const Matrix& matrix, Rect device_bounds,
                const Rect* local_bounds, BlendMode mode, Shade&& shade) {
  Matrix inverse;
  if (!matrix.Invert(&inverse)) {
    return;
  }

  if (!device_bounds.Intersect(Rect::MakeWH(bitmap->Width(),
                                            bitmap->Height()))) {
    return;
  }

  // pixel x is covered when x + 0.5 is in [left, right)
  auto x_begin = static_cast<int32_t>(std::ceil(device_bounds.Left() - 0.5f));
  auto x_end = static_cast<int32_t>(std::ceil(device_bounds.Right() - 0.5f));
  auto y_begin = static_cast<int32_t>(std::ceil(device_bounds.Top() - 0.5f));
  auto y_end = static_cast<int32_t>(std::ceil(device_bounds.Bottom() - 0.5f));

  for (int32_t y = y_begin; y < y_end; y++) {
    for (int32_t x = x_begin; x < x_end; x++) {
      Vec2 local = inverse.MapPoint(Vec2{x + 0.5f, y + 0.5f});
      if (local_bounds && !local_bounds->Contains(local.x, local.y)) {
        continue;
      }

      auto px = static_cast<uint32_t>(x);
      auto py = static_cast<uint32_t>(y);
      Color4f dst = Premultiply(Color4fFromColor(bitmap->GetPixel(px, py)));
      Color4f result = Blend(shade(local), dst, mode);
      bitmap->SetPixel(px, py, Color4fToColor(Unpremultiply(result)));
    }
  }
}

Color4f PaintSourceColor(const Paint& paint, const Vec2& local) {
  if (paint.GetShader()) {
    Color4f color = paint.GetShader()->ColorAt(local);
    color.a *= paint.GetAlphaF();
    return Premultiply(color);
  }
  return Premultiply(Color4fFromColor(paint.GetColor()));
}

}  // namespace

BitmapCanvas::BitmapCanvas(std::shared_ptr<Bitmap> bitmap)
    : Canvas(bitmap ? Rect::MakeWH(bitmap->Width(), bitmap->Height())
                    : Rect::MakeEmpty()),
      bitmap_(std::move(bitmap)) {}

void BitmapCanvas::SetBitmap(std::shared_ptr<Bitmap> bitmap) {
  bitmap_ = std::move(bitmap);
  ResetState(BitmapBounds());
}

Rect BitmapCanvas::BitmapBounds() const {
  if (!bitmap_) {
    return Rect::MakeEmpty();
  }
  return Rect::MakeWH(bitmap_->Width(), bitmap_->Height());
}

void BitmapCanvas::OnDrawRect(const Rect& rect, const Paint& paint) {
  if (!bitmap_) {
    return;
  }

  const Matrix& matrix = GetTotalMatrix();
  Rect device_bounds = matrix.MapRect(rect);
  if (!device_bounds.Intersect(GetDeviceClipBounds())) {
    return;
  }

  FillPixels(bitmap_.get(), matrix, device_bounds, &rect, paint.GetBlendMode(),
             [&paint](const Vec2& local) {
               return PaintSourceColor(paint, local);
             });
}

void BitmapCanvas::OnDrawPaint(const Paint& paint) {
  if (!bitmap_) {
    return;
  }

  FillPixels(bitmap_.get(), GetTotalMatrix(), GetDeviceClipBounds(), nullptr,
             paint.GetBlendMode(), [&paint](const Vec2& local) {
               return PaintSourceColor(paint, local);
             });
}

void BitmapCanvas::OnDrawBitmap(const std::shared_ptr<Bitmap>& bitmap,
                                float left, float top, const Paint& paint) {
  if (!bitmap_) {
    return;
  }

  if (bitmap == bitmap_) {
    LOGW("BitmapCanvas can not draw its own target bitmap");
    return;
  }

  Rect local_bounds =
      Rect::MakeXYWH(left, top, bitmap->Width(), bitmap->Height());
  const Matrix& matrix = GetTotalMatrix();
  Rect device_bounds = matrix.MapRect(local_bounds);
  if (!device_bounds.Intersect(GetDeviceClipBounds())) {
    return;
  }

  float alpha = paint.GetAlphaF();
  FilterMode filter = paint.GetFilterMode();
  FillPixels(bitmap_.get(), matrix, device_bounds, &local_bounds,
             paint.GetBlendMode(), [&](const Vec2& local) {
               return SampleBitmap(*bitmap, local.x - left, local.y - top,
                                   filter) *
                      alpha;
             });
}

void BitmapCanvas::OnDrawRenderNode(RenderNode* node) {
  if (node->GetRenderEffect()) {
    LOGD("BitmapCanvas draws RenderNode(%s) without its render effect",
         node->GetName().c_str());
  }
  node->Draw(this);
}

}  // namespace frost
