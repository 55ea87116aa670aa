// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_RENDER_DISPLAY_LIST_HPP
#define INCLUDE_FROST_RENDER_DISPLAY_LIST_HPP

#include <frost/macros.hpp>
#include <frost/render/canvas.hpp>
#include <functional>
#include <memory>
#include <vector>

namespace frost {

/**
 * An ordered list of canvas operations produced by a RecordingCanvas.
 *
 * Bitmaps and nodes are referenced, not copied: if a recorded bitmap changes
 * after recording, playback shows the new pixels.
 */
class FROST_API DisplayList {
 public:
  using Op = std::function<void(Canvas*)>;

  DisplayList() = default;
  ~DisplayList() = default;

  DisplayList(const DisplayList&) = delete;
  DisplayList& operator=(const DisplayList&) = delete;

  void Append(Op op) { ops_.emplace_back(std::move(op)); }

  size_t Size() const { return ops_.size(); }

  bool Empty() const { return ops_.empty(); }

  /**
   * Replay all operations on canvas. The canvas state is restored when
   * playback finishes.
   */
  void Draw(Canvas* canvas) const;

 private:
  std::vector<Op> ops_;
};

/**
 * Canvas that records every call into a DisplayList instead of drawing.
 */
class FROST_API RecordingCanvas : public Canvas {
 public:
  RecordingCanvas();
  ~RecordingCanvas() override = default;

  /**
   * Drop everything recorded so far and start again with a fresh state.
   */
  void BeginRecording();

  /**
   * @return the recorded operations. The canvas is empty afterwards.
   */
  std::unique_ptr<DisplayList> FinishRecording();

  size_t RecordedOpCount() const { return display_list_->Size(); }

 protected:
  void OnSave() override;
  void OnRestore() override;
  void DidConcat(const Matrix& matrix) override;
  void OnClipRect(const Rect& rect) override;

  void OnDrawRect(const Rect& rect, const Paint& paint) override;
  void OnDrawPaint(const Paint& paint) override;
  void OnDrawBitmap(const std::shared_ptr<Bitmap>& bitmap, float left,
                    float top, const Paint& paint) override;
  void OnDrawRenderNode(RenderNode* node) override;

 private:
  std::unique_ptr<DisplayList> display_list_;
};

}  // namespace frost

#endif  // INCLUDE_FROST_RENDER_DISPLAY_LIST_HPP
