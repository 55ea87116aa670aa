// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include <frost/graphic/paint.hpp>
#include <glm/glm.hpp>

namespace frost {

void Paint::SetAlphaF(float a) {
  SetAlpha(static_cast<uint8_t>(glm::clamp(a, 0.f, 1.f) * 255.f + 0.5f));
}

}  // namespace frost
