// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_BLUR_BLUR_REGION_HPP
#define INCLUDE_FROST_BLUR_BLUR_REGION_HPP

#include <cstdint>
#include <frost/geometry/point.hpp>
#include <frost/macros.hpp>
#include <frost/render/canvas.hpp>
#include <frost/render/render_node.hpp>

namespace frost {

class PreDrawDispatcher;

/**
 * The content being blurred, the layer "behind" the blurred surface.
 *
 * Implemented by the host UI toolkit. Controllers keep a non-owning pointer,
 * the target must outlive the controller.
 */
class FROST_API BlurTarget {
 public:
  virtual ~BlurTarget() = default;

  virtual int32_t GetWidth() const = 0;
  virtual int32_t GetHeight() const = 0;

  /**
   * Top left corner of the target in screen coordinates.
   */
  virtual IPoint GetLocationOnScreen() const = 0;

  /**
   * Draw the target and everything behind it into canvas. Used for snapshot
   * capture. May throw if some content can not be drawn into a software
   * canvas; the blur controllers catch and log std::exception.
   */
  virtual void Draw(Canvas* canvas) = 0;

  /**
   * The node holding the recorded draw output of the target, or null if the
   * host does not render through retained nodes.
   */
  virtual RenderNode* GetRenderNode() { return nullptr; }
};

/**
 * The surface displaying the blurred result.
 *
 * Implemented by the host UI toolkit. Controllers keep a non-owning pointer,
 * the host must outlive the controller.
 */
class FROST_API BlurHost {
 public:
  virtual ~BlurHost() = default;

  /**
   * Current laid out size.
   */
  virtual int32_t GetWidth() const = 0;
  virtual int32_t GetHeight() const = 0;

  /**
   * Size reported by the last measure pass. May differ from the laid out size
   * while a layout is pending.
   */
  virtual int32_t GetMeasuredWidth() const = 0;
  virtual int32_t GetMeasuredHeight() const = 0;

  virtual IPoint GetLocationOnScreen() const = 0;

  /**
   * Request a redraw of the host.
   */
  virtual void Invalidate() = 0;

  /**
   * Hint that the host has nothing to draw and can skip its draw pass.
   */
  virtual void SetWillNotDraw(bool will_not_draw) = 0;

  /**
   * Pre-draw dispatcher of the window the host lives in. Must not be null.
   */
  virtual PreDrawDispatcher* GetPreDrawDispatcher() = 0;

  /**
   * Pre-draw dispatcher of the window the target lives in. Defaults to the
   * host window.
   */
  virtual PreDrawDispatcher* GetTargetPreDrawDispatcher() {
    return GetPreDrawDispatcher();
  }

  /**
   * @return true if the rendering backend of the host window evaluates
   *         RenderEffect graphs. Queried once when a controller is created.
   */
  virtual bool SupportsRenderEffects() const { return false; }
};

}  // namespace frost

#endif  // INCLUDE_FROST_BLUR_BLUR_REGION_HPP
