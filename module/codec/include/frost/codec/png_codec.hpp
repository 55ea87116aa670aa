// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_CODEC_PNG_CODEC_HPP
#define INCLUDE_FROST_CODEC_PNG_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <frost/graphic/bitmap.hpp>
#include <frost/macros.hpp>
#include <memory>
#include <vector>

namespace frost {

/**
 * PNG encoding of frost bitmaps, backed by libpng. Used to dump blurred
 * snapshots for inspection.
 */
class FROST_API PNGCodec {
 public:
  /**
   * @return true if header starts with the PNG signature
   */
  static bool RecognizeFileType(const uint8_t* header, size_t size);

  /**
   * Encode as 8 bit RGBA, unpremultiplied.
   *
   * @return empty on failure
   */
  static std::vector<uint8_t> Encode(const Bitmap& bitmap);

  /**
   * @return null if data is not a readable PNG
   */
  static std::shared_ptr<Bitmap> Decode(const uint8_t* data, size_t size);
};

}  // namespace frost

#endif  // INCLUDE_FROST_CODEC_PNG_CODEC_HPP
