// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include <frost/render/drawable.hpp>

namespace frost {

void ColorDrawable::Draw(Canvas* canvas) {
  Paint paint;
  paint.SetColor(color_);

  if (GetBounds().IsEmpty()) {
    canvas->DrawPaint(paint);
  } else {
    canvas->DrawRect(GetBounds(), paint);
  }
}

}  // namespace frost
