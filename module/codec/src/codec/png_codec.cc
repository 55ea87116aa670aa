// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include <png.h>

#include <frost/codec/png_codec.hpp>

#include "src/logging.hpp"

namespace frost {

#define PNG_BYTES_TO_CHECK 4

static void png_write_callback(png_structp png_ptr, png_bytep data,
                               png_size_t length) {
  auto encoded_data =
      reinterpret_cast<std::vector<uint8_t>*>(png_get_io_ptr(png_ptr));

  encoded_data->insert(encoded_data->end(), data, data + length);
}

struct PNGImage {
  png_image image = {};

  PNGImage() : image() { image.version = PNG_IMAGE_VERSION; }

  ~PNGImage() { png_image_free(&image); }
};

struct PNGWriteStruct {
  png_structp png_ptr = nullptr;
  png_infop info_ptr = nullptr;

  ~PNGWriteStruct() {
    if (png_ptr) {
      png_destroy_write_struct(&png_ptr, info_ptr ? &info_ptr : nullptr);
    }
  }
};

bool PNGCodec::RecognizeFileType(const uint8_t* header, size_t size) {
  if (header == nullptr || size < PNG_BYTES_TO_CHECK) {
    return false;
  }
  return !png_sig_cmp(header, 0, PNG_BYTES_TO_CHECK);
}

std::vector<uint8_t> PNGCodec::Encode(const Bitmap& bitmap) {
  PNGWriteStruct png;
  png.png_ptr =
      png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
  if (!png.png_ptr) {
    LOGE("png_create_write_struct failed");
    return {};
  }

  png.info_ptr = png_create_info_struct(png.png_ptr);
  if (!png.info_ptr) {
    LOGE("png_create_info_struct failed");
    return {};
  }

  png_set_IHDR(png.png_ptr, png.info_ptr, bitmap.Width(), bitmap.Height(), 8,
               PNG_COLOR_TYPE_RGBA, PNG_INTERLACE_NONE,
               PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);

  std::vector<uint8_t> encode_data{};
  png_set_write_fn(png.png_ptr, &encode_data, png_write_callback, nullptr);

  png_write_info(png.png_ptr, png.info_ptr);

  // Bitmap stores packed ARGB words, png wants RGBA bytes.
  std::vector<uint8_t> row(bitmap.Width() * 4);
  for (uint32_t y = 0; y < bitmap.Height(); y++) {
    const Color* src = bitmap.Pixels() + y * bitmap.Width();
    for (uint32_t x = 0; x < bitmap.Width(); x++) {
      row[x * 4 + 0] = ColorGetR(src[x]);
      row[x * 4 + 1] = ColorGetG(src[x]);
      row[x * 4 + 2] = ColorGetB(src[x]);
      row[x * 4 + 3] = ColorGetA(src[x]);
    }
    png_write_row(png.png_ptr, row.data());
  }

  png_write_end(png.png_ptr, png.info_ptr);

  return encode_data;
}

std::shared_ptr<Bitmap> PNGCodec::Decode(const uint8_t* data, size_t size) {
  if (!RecognizeFileType(data, size)) {
    return nullptr;
  }

  PNGImage png_image{};
  if (!png_image_begin_read_from_memory(&png_image.image, data, size)) {
    LOGE("Failed to read png header: %s", png_image.image.message);
    return nullptr;
  }

  png_image.image.format = PNG_FORMAT_RGBA;
  std::vector<uint8_t> buffer(PNG_IMAGE_SIZE(png_image.image));

  if (!png_image_finish_read(&png_image.image, nullptr, buffer.data(), 0,
                             nullptr)) {
    LOGE("Failed to decode png: %s", png_image.image.message);
    return nullptr;
  }

  uint32_t width = png_image.image.width;
  uint32_t height = png_image.image.height;
  auto bitmap = Bitmap::Make(width, height);
  if (!bitmap) {
    return nullptr;
  }

  Color* dst = bitmap->Pixels();
  for (size_t i = 0; i < static_cast<size_t>(width) * height; i++) {
    const uint8_t* p = buffer.data() + i * 4;
    dst[i] = ColorSetARGB(p[3], p[0], p[1], p[2]);
  }
  return bitmap;
}

}  // namespace frost
