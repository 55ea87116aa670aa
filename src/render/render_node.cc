// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include <frost/render/render_node.hpp>
#include <utility>

#include "src/logging.hpp"

namespace frost {

namespace {

bool UpdateProperty(float* property, float value) {
  if (*property == value) {
    return false;
  }
  *property = value;
  return true;
}

}  // namespace

RenderNode::RenderNode(std::string name)
    : name_(std::move(name)),
      recording_canvas_(std::make_unique<RecordingCanvas>()) {}

bool RenderNode::SetPosition(const Rect& position) {
  if (position_ == position) {
    return false;
  }
  position_ = position;
  return true;
}

bool RenderNode::SetTranslationX(float x) {
  return UpdateProperty(&translation_x_, x);
}

bool RenderNode::SetTranslationY(float y) {
  return UpdateProperty(&translation_y_, y);
}

bool RenderNode::SetPivotX(float x) { return UpdateProperty(&pivot_x_, x); }

bool RenderNode::SetPivotY(float y) { return UpdateProperty(&pivot_y_, y); }

bool RenderNode::SetScaleX(float sx) { return UpdateProperty(&scale_x_, sx); }

bool RenderNode::SetScaleY(float sy) { return UpdateProperty(&scale_y_, sy); }

bool RenderNode::SetRotationZ(float degrees) {
  return UpdateProperty(&rotation_z_, degrees);
}

void RenderNode::SetRenderEffect(std::shared_ptr<RenderEffect> effect) {
  render_effect_ = std::move(effect);
  effect_generation_++;
}

RecordingCanvas* RenderNode::BeginRecording() {
  if (recording_) {
    LOGW("RenderNode(%s)::BeginRecording while already recording",
         name_.c_str());
  }
  recording_ = true;
  recording_canvas_->BeginRecording();
  return recording_canvas_.get();
}

void RenderNode::EndRecording() {
  if (!recording_) {
    LOGW("RenderNode(%s)::EndRecording without BeginRecording", name_.c_str());
    return;
  }
  recording_ = false;
  display_list_ = recording_canvas_->FinishRecording();
}

void RenderNode::DiscardDisplayList() {
  if (recording_) {
    recording_canvas_->FinishRecording();
    recording_ = false;
  }
  display_list_.reset();
}

Matrix RenderNode::GetTransform() const {
  Matrix matrix = Matrix::Translate(position_.Left() + translation_x_,
                                    position_.Top() + translation_y_);
  if (rotation_z_ != 0.f || scale_x_ != 1.f || scale_y_ != 1.f) {
    matrix.PreTranslate(pivot_x_, pivot_y_);
    matrix.PreConcat(Matrix::RotateDeg(rotation_z_));
    matrix.PreScale(scale_x_, scale_y_);
    matrix.PreTranslate(-pivot_x_, -pivot_y_);
  }
  return matrix;
}

void RenderNode::Draw(Canvas* canvas) const {
  if (!display_list_) {
    return;
  }

  int save_count = canvas->Save();
  canvas->Concat(GetTransform());
  canvas->ClipRect(Rect::MakeWH(position_.Width(), position_.Height()));
  display_list_->Draw(canvas);
  canvas->RestoreToCount(save_count);
}

}  // namespace frost
