// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include <frost/render/canvas.hpp>

#include "src/logging.hpp"

namespace frost {

Canvas::Canvas() : Canvas(Rect::MakeLargest()) {}

Canvas::Canvas(const Rect& device_bounds) { ResetState(device_bounds); }

void Canvas::ResetState(const Rect& device_bounds) {
  state_stack_.clear();
  state_stack_.emplace_back(State{Matrix{}, device_bounds});
}

int Canvas::Save() {
  int count = GetSaveCount();
  state_stack_.emplace_back(state_stack_.back());
  OnSave();
  return count;
}

void Canvas::Restore() {
  // the bottom state is never popped
  if (state_stack_.size() <= 1) {
    return;
  }
  state_stack_.pop_back();
  OnRestore();
}

void Canvas::RestoreToCount(int count) {
  if (count < 1) {
    count = 1;
  }
  while (GetSaveCount() > count) {
    Restore();
  }
}

void Canvas::Translate(float dx, float dy) {
  if (dx == 0.f && dy == 0.f) {
    return;
  }
  Concat(Matrix::Translate(dx, dy));
}

void Canvas::Scale(float sx, float sy) {
  if (sx == 1.f && sy == 1.f) {
    return;
  }
  Concat(Matrix::Scale(sx, sy));
}

void Canvas::Rotate(float degrees) {
  if (degrees == 0.f) {
    return;
  }
  Concat(Matrix::RotateDeg(degrees));
}

void Canvas::Rotate(float degrees, float px, float py) {
  if (degrees == 0.f) {
    return;
  }
  Concat(Matrix::RotateDeg(degrees, px, py));
}

void Canvas::Concat(const Matrix& matrix) {
  if (matrix.IsIdentity()) {
    return;
  }
  state_stack_.back().matrix.PreConcat(matrix);
  DidConcat(matrix);
}

void Canvas::ClipRect(const Rect& rect) {
  auto& state = state_stack_.back();
  Rect device_rect = state.matrix.MapRect(rect);
  state.clip_bounds.Intersect(device_rect);
  OnClipRect(rect);
}

void Canvas::DrawRect(const Rect& rect, const Paint& paint) {
  if (rect.IsEmpty()) {
    return;
  }
  OnDrawRect(rect, paint);
}

void Canvas::DrawPaint(const Paint& paint) { OnDrawPaint(paint); }

void Canvas::DrawColor(Color color, BlendMode mode) {
  Paint paint;
  paint.SetColor(color);
  paint.SetBlendMode(mode);
  OnDrawPaint(paint);
}

void Canvas::DrawBitmap(const std::shared_ptr<Bitmap>& bitmap, float left,
                        float top, const Paint* paint) {
  if (!bitmap) {
    LOGW("Canvas::DrawBitmap with null bitmap");
    return;
  }
  Paint default_paint;
  OnDrawBitmap(bitmap, left, top, paint ? *paint : default_paint);
}

void Canvas::DrawRenderNode(RenderNode* node) {
  if (!node) {
    LOGW("Canvas::DrawRenderNode with null node");
    return;
  }
  OnDrawRenderNode(node);
}

}  // namespace frost
