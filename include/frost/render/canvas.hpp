// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_RENDER_CANVAS_HPP
#define INCLUDE_FROST_RENDER_CANVAS_HPP

#include <frost/geometry/matrix.hpp>
#include <frost/geometry/rect.hpp>
#include <frost/graphic/bitmap.hpp>
#include <frost/graphic/paint.hpp>
#include <frost/macros.hpp>
#include <memory>
#include <vector>

namespace frost {

class RenderNode;

/**
 * Canvas keeps a stack of matrix and clip state and forwards draw calls to
 * the backend implemented by a subclass.
 *
 * Clips are tracked in device space as axis aligned bounds. A clip under a
 * rotation is approximated by the bounds of the rotated rectangle.
 */
class FROST_API Canvas {
 public:
  virtual ~Canvas() = default;

  Canvas(const Canvas&) = delete;
  Canvas& operator=(const Canvas&) = delete;

  /**
   * Push the current matrix and clip onto the state stack.
   *
   * @return the save count before this call
   */
  int Save();

  /**
   * Pop the state stack. Calling Restore more times than Save is ignored.
   */
  void Restore();

  int GetSaveCount() const { return static_cast<int>(state_stack_.size()); }

  /**
   * Restore until the save count equals count. Does nothing if count is not
   * less than the current save count.
   */
  void RestoreToCount(int count);

  void Translate(float dx, float dy);
  void Scale(float sx, float sy);
  void Rotate(float degrees);
  void Rotate(float degrees, float px, float py);
  void Concat(const Matrix& matrix);

  void ClipRect(const Rect& rect);

  void DrawRect(const Rect& rect, const Paint& paint);

  /**
   * Fill the whole clip with paint.
   */
  void DrawPaint(const Paint& paint);

  void DrawColor(Color color, BlendMode mode = BlendMode::kSrcOver);

  void Clear(Color color) { DrawColor(color, BlendMode::kSrc); }

  /**
   * Draw bitmap with its top left corner at (left, top). The bitmap occupies
   * one local unit per pixel, so scale the canvas to stretch it.
   */
  void DrawBitmap(const std::shared_ptr<Bitmap>& bitmap, float left,
                  float top, const Paint* paint = nullptr);

  void DrawRenderNode(RenderNode* node);

  const Matrix& GetTotalMatrix() const { return state_stack_.back().matrix; }

  const Rect& GetDeviceClipBounds() const {
    return state_stack_.back().clip_bounds;
  }

  /**
   * @return true if this canvas is backed by a renderer that evaluates
   *         RenderEffect graphs attached to RenderNodes.
   */
  virtual bool IsHardwareAccelerated() const { return false; }

 protected:
  Canvas();
  explicit Canvas(const Rect& device_bounds);

  /**
   * Reset the state stack to identity matrix and the given device bounds.
   */
  void ResetState(const Rect& device_bounds);

  virtual void OnSave() {}
  virtual void OnRestore() {}
  virtual void DidConcat(const Matrix& matrix) {}
  virtual void OnClipRect(const Rect& rect) {}

  virtual void OnDrawRect(const Rect& rect, const Paint& paint) = 0;
  virtual void OnDrawPaint(const Paint& paint) = 0;
  virtual void OnDrawBitmap(const std::shared_ptr<Bitmap>& bitmap, float left,
                            float top, const Paint& paint) = 0;
  virtual void OnDrawRenderNode(RenderNode* node) = 0;

 private:
  struct State {
    Matrix matrix = {};
    Rect clip_bounds = {};
  };

  std::vector<State> state_stack_;
};

}  // namespace frost

#endif  // INCLUDE_FROST_RENDER_CANVAS_HPP
