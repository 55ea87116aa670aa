// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef SRC_BLUR_COORDINATE_TRACKER_HPP
#define SRC_BLUR_COORDINATE_TRACKER_HPP

#include <cstdint>
#include <frost/blur/blur_region.hpp>
#include <frost/geometry/point.hpp>

namespace frost {

/**
 * Tracks how far the host has moved relative to the target, in screen space.
 * Scrolling containers and animations move them independently, so this is
 * refreshed every frame.
 */
class CoordinateTracker {
 public:
  CoordinateTracker(const BlurHost* host, const BlurTarget* target)
      : host_(host), target_(target) {}

  /**
   * Read the current on screen location of host and target.
   */
  void Refresh();

  /**
   * host location - target location, as of the last Refresh.
   */
  IPoint Offset() const { return host_location_ - target_location_; }

  int32_t GetLeft() const { return Offset().x; }
  int32_t GetTop() const { return Offset().y; }

  const IPoint& GetHostLocation() const { return host_location_; }
  const IPoint& GetTargetLocation() const { return target_location_; }

 private:
  const BlurHost* host_;
  const BlurTarget* target_;
  IPoint host_location_ = {};
  IPoint target_location_ = {};
};

}  // namespace frost

#endif  // SRC_BLUR_COORDINATE_TRACKER_HPP
