// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef EXAMPLE_COMMON_BOX_BLUR_HPP
#define EXAMPLE_COMMON_BOX_BLUR_HPP

#include <frost/blur/blur_algorithm.hpp>
#include <memory>

namespace frost {
namespace example {

/**
 * Separable box blur on the CPU, in place. Good enough to show the snapshot
 * pipeline working, far from the quality of a gaussian.
 */
class BoxBlur : public BlurAlgorithm {
 public:
  BoxBlur() = default;
  ~BoxBlur() override = default;

  std::shared_ptr<Bitmap> Blur(std::shared_ptr<Bitmap> bitmap,
                               float radius) override;

  void Destroy() override { destroyed_ = true; }

  bool CanModifyBitmap() const override { return true; }

  bool IsDestroyed() const { return destroyed_; }

  int BlurCount() const { return blur_count_; }

 private:
  bool destroyed_ = false;
  int blur_count_ = 0;
};

}  // namespace example
}  // namespace frost

#endif  // EXAMPLE_COMMON_BOX_BLUR_HPP
