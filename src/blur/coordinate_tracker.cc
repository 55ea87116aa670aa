// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include "src/blur/coordinate_tracker.hpp"

namespace frost {

void CoordinateTracker::Refresh() {
  target_location_ = target_->GetLocationOnScreen();
  host_location_ = host_->GetLocationOnScreen();
}

}  // namespace frost
