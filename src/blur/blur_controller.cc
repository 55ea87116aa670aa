// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include <frost/blur/blur_controller.hpp>
#include <frost/blur/pre_draw_dispatcher.hpp>

#include "src/blur/render_node_blur_controller.hpp"
#include "src/blur/snapshot_blur_controller.hpp"
#include "src/logging.hpp"

namespace frost {

std::unique_ptr<BlurController> BlurController::Make(
    const BlurControllerDescriptor& desc) {
  if (desc.host == nullptr || desc.target == nullptr) {
    LOGE("BlurController needs both a host and a target");
    return nullptr;
  }

  if (desc.host->GetPreDrawDispatcher() == nullptr) {
    LOGE("BlurController host has no pre-draw dispatcher");
    return nullptr;
  }

  if (desc.host->SupportsRenderEffects() &&
      desc.target->GetRenderNode() != nullptr) {
    LOGD("Using render node blur");
    return std::make_unique<RenderNodeBlurController>(desc);
  }

  if (!desc.blur_algorithm) {
    LOGE("Snapshot blur needs a blur algorithm");
    return nullptr;
  }

  LOGD("Using snapshot blur");
  return std::make_unique<SnapshotBlurController>(desc);
}

}  // namespace frost
