// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_BLUR_GRADIENT_DIRECTION_HPP
#define INCLUDE_FROST_BLUR_GRADIENT_DIRECTION_HPP

namespace frost {

/**
 * Direction in which a blur fade mask or an overlay gradient runs. The start
 * of the direction is where the blur (or start color) is strongest.
 */
enum class GradientDirection {
  kNone,
  kTopToBottom,
  kBottomToTop,
  kLeftToRight,
  kRightToLeft,
};

}  // namespace frost

#endif  // INCLUDE_FROST_BLUR_GRADIENT_DIRECTION_HPP
