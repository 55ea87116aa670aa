// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_BLUR_PRE_DRAW_DISPATCHER_HPP
#define INCLUDE_FROST_BLUR_PRE_DRAW_DISPATCHER_HPP

#include <cstdint>
#include <frost/macros.hpp>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace frost {

class PreDrawDispatcher;

/**
 * Owning handle of a pre-draw listener registration. The listener is removed
 * when the handle is reset or destroyed. Outliving the dispatcher is safe.
 */
class FROST_API PreDrawSubscription {
 public:
  PreDrawSubscription() = default;
  ~PreDrawSubscription() { Reset(); }

  PreDrawSubscription(PreDrawSubscription&& other) noexcept;
  PreDrawSubscription& operator=(PreDrawSubscription&& other) noexcept;

  PreDrawSubscription(const PreDrawSubscription&) = delete;
  PreDrawSubscription& operator=(const PreDrawSubscription&) = delete;

  void Reset();

  bool IsActive() const;

 private:
  friend class PreDrawDispatcher;

  struct Registry;

  PreDrawSubscription(std::weak_ptr<Registry> registry, uint64_t id)
      : registry_(std::move(registry)), id_(id) {}

  std::weak_ptr<Registry> registry_ = {};
  uint64_t id_ = 0;
};

/**
 * Per-window list of callbacks run before each draw pass, after layout.
 *
 * Owned by the host. Single threaded: subscribe, unsubscribe and dispatch
 * must all happen on the UI thread.
 */
class FROST_API PreDrawDispatcher {
 public:
  /**
   * Return false to cancel the current draw pass.
   */
  using Listener = std::function<bool()>;

  PreDrawDispatcher();
  ~PreDrawDispatcher() = default;

  PreDrawDispatcher(const PreDrawDispatcher&) = delete;
  PreDrawDispatcher& operator=(const PreDrawDispatcher&) = delete;

  [[nodiscard]] PreDrawSubscription Subscribe(Listener listener);

  /**
   * Run every listener in subscription order. A listener removed by an
   * earlier listener of the same pass is not run.
   *
   * @return false if any listener asked to cancel the draw pass
   */
  bool DispatchPreDraw();

  size_t ListenerCount() const;

 private:
  std::shared_ptr<PreDrawSubscription::Registry> registry_;
};

}  // namespace frost

#endif  // INCLUDE_FROST_BLUR_PRE_DRAW_DISPATCHER_HPP
