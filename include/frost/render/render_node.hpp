// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_RENDER_RENDER_NODE_HPP
#define INCLUDE_FROST_RENDER_RENDER_NODE_HPP

#include <cstdint>
#include <frost/effect/render_effect.hpp>
#include <frost/geometry/matrix.hpp>
#include <frost/geometry/rect.hpp>
#include <frost/macros.hpp>
#include <frost/render/display_list.hpp>
#include <memory>
#include <string>

namespace frost {

/**
 * A persistent node of the retained rendering graph.
 *
 * The node owns a display list and a set of transform properties. When it is
 * drawn the rendering backend applies, in order: the position offset, the
 * translation, and the scale and rotation around the pivot. An attached
 * RenderEffect is evaluated on the node output by the backend every time the
 * node is drawn.
 *
 * Recorded node references inside the display list are not owned. The
 * recorded node must outlive any playback of this node.
 */
class FROST_API RenderNode {
 public:
  explicit RenderNode(std::string name);
  ~RenderNode() = default;

  RenderNode(const RenderNode&) = delete;
  RenderNode& operator=(const RenderNode&) = delete;

  const std::string& GetName() const { return name_; }

  /**
   * @return true if the position changed
   */
  bool SetPosition(const Rect& position);
  const Rect& GetPosition() const { return position_; }
  float GetWidth() const { return position_.Width(); }
  float GetHeight() const { return position_.Height(); }

  bool SetTranslationX(float x);
  bool SetTranslationY(float y);
  float GetTranslationX() const { return translation_x_; }
  float GetTranslationY() const { return translation_y_; }

  bool SetPivotX(float x);
  bool SetPivotY(float y);
  float GetPivotX() const { return pivot_x_; }
  float GetPivotY() const { return pivot_y_; }

  bool SetScaleX(float sx);
  bool SetScaleY(float sy);
  float GetScaleX() const { return scale_x_; }
  float GetScaleY() const { return scale_y_; }

  bool SetRotationZ(float degrees);
  float GetRotationZ() const { return rotation_z_; }

  /**
   * Attach an effect, replacing the previous one. Passing null removes it.
   * Every call counts as a new effect for the backend, even if the same
   * instance is set again, which forces the node to re-render.
   */
  void SetRenderEffect(std::shared_ptr<RenderEffect> effect);
  const std::shared_ptr<RenderEffect>& GetRenderEffect() const {
    return render_effect_;
  }

  /**
   * @return how many times SetRenderEffect was called
   */
  uint64_t GetRenderEffectGeneration() const { return effect_generation_; }

  /**
   * Start recording the node content. The returned canvas is owned by the
   * node and valid until EndRecording.
   */
  RecordingCanvas* BeginRecording();

  void EndRecording();

  bool IsRecording() const { return recording_; }

  void DiscardDisplayList();

  bool HasDisplayList() const { return display_list_ != nullptr; }

  const DisplayList* GetDisplayList() const { return display_list_.get(); }

  /**
   * Matrix mapping node local coordinates into the coordinate space of the
   * canvas the node is drawn into.
   */
  Matrix GetTransform() const;

  /**
   * Software playback: draws the display list under the node transform,
   * clipped to the node bounds. The render effect is not evaluated here.
   */
  void Draw(Canvas* canvas) const;

 private:
  std::string name_;
  Rect position_ = {};
  float translation_x_ = 0.f;
  float translation_y_ = 0.f;
  float pivot_x_ = 0.f;
  float pivot_y_ = 0.f;
  float scale_x_ = 1.f;
  float scale_y_ = 1.f;
  float rotation_z_ = 0.f;

  std::shared_ptr<RenderEffect> render_effect_ = {};
  uint64_t effect_generation_ = 0;

  bool recording_ = false;
  std::unique_ptr<RecordingCanvas> recording_canvas_;
  std::unique_ptr<DisplayList> display_list_;
};

}  // namespace frost

#endif  // INCLUDE_FROST_RENDER_RENDER_NODE_HPP
