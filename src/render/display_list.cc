// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include <frost/render/display_list.hpp>
#include <utility>

namespace frost {

void DisplayList::Draw(Canvas* canvas) const {
  int save_count = canvas->Save();
  for (const auto& op : ops_) {
    op(canvas);
  }
  canvas->RestoreToCount(save_count);
}

RecordingCanvas::RecordingCanvas()
    : display_list_(std::make_unique<DisplayList>()) {}

void RecordingCanvas::BeginRecording() {
  display_list_ = std::make_unique<DisplayList>();
  ResetState(Rect::MakeLargest());
}

std::unique_ptr<DisplayList> RecordingCanvas::FinishRecording() {
  auto result = std::move(display_list_);
  display_list_ = std::make_unique<DisplayList>();
  ResetState(Rect::MakeLargest());
  return result;
}

void RecordingCanvas::OnSave() {
  display_list_->Append([](Canvas* canvas) { canvas->Save(); });
}

void RecordingCanvas::OnRestore() {
  display_list_->Append([](Canvas* canvas) { canvas->Restore(); });
}

void RecordingCanvas::DidConcat(const Matrix& matrix) {
  display_list_->Append([matrix](Canvas* canvas) { canvas->Concat(matrix); });
}

void RecordingCanvas::OnClipRect(const Rect& rect) {
  display_list_->Append([rect](Canvas* canvas) { canvas->ClipRect(rect); });
}

void RecordingCanvas::OnDrawRect(const Rect& rect, const Paint& paint) {
  display_list_->Append(
      [rect, paint](Canvas* canvas) { canvas->DrawRect(rect, paint); });
}

void RecordingCanvas::OnDrawPaint(const Paint& paint) {
  display_list_->Append([paint](Canvas* canvas) { canvas->DrawPaint(paint); });
}

void RecordingCanvas::OnDrawBitmap(const std::shared_ptr<Bitmap>& bitmap,
                                   float left, float top, const Paint& paint) {
  display_list_->Append([bitmap, left, top, paint](Canvas* canvas) {
    canvas->DrawBitmap(bitmap, left, top, &paint);
  });
}

void RecordingCanvas::OnDrawRenderNode(RenderNode* node) {
  display_list_->Append(
      [node](Canvas* canvas) { canvas->DrawRenderNode(node); });
}

}  // namespace frost
