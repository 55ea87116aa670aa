// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_GRAPHIC_BLEND_MODE_HPP
#define INCLUDE_FROST_GRAPHIC_BLEND_MODE_HPP

namespace frost {

/**
 * Porter-Duff modes supported by the compositing pipeline.
 *
 * kDstIn keeps the destination only where the source is opaque, which is how
 * a gradient mask fades a blur effect out.
 */
enum class BlendMode {
  kClear,    //!< r = 0
  kSrc,      //!< r = s
  kDst,      //!< r = d
  kSrcOver,  //!< r = s + (1-sa)*d
  kDstOver,  //!< r = d + (1-da)*s
  kSrcIn,    //!< r = s * da
  kDstIn,    //!< r = d * sa
  kSrcOut,   //!< r = s * (1-da)
  kDstOut,   //!< r = d * (1-sa)
  kDefault = kSrcOver,
};

}  // namespace frost

#endif  // INCLUDE_FROST_GRAPHIC_BLEND_MODE_HPP
