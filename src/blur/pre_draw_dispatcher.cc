// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include <algorithm>
#include <frost/blur/pre_draw_dispatcher.hpp>

namespace frost {

struct PreDrawSubscription::Registry {
  struct Entry {
    uint64_t id;
    std::shared_ptr<PreDrawDispatcher::Listener> listener;
  };

  std::vector<Entry> entries;
  uint64_t next_id = 1;

  void Remove(uint64_t id) {
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [id](const Entry& e) { return e.id == id; }),
                  entries.end());
  }

  bool Contains(uint64_t id) const {
    return std::any_of(entries.begin(), entries.end(),
                       [id](const Entry& e) { return e.id == id; });
  }
};

PreDrawSubscription::PreDrawSubscription(PreDrawSubscription&& other) noexcept
    : registry_(std::move(other.registry_)), id_(other.id_) {
  other.registry_.reset();
  other.id_ = 0;
}

PreDrawSubscription& PreDrawSubscription::operator=(
    PreDrawSubscription&& other) noexcept {
  if (this != &other) {
    Reset();
    registry_ = std::move(other.registry_);
    id_ = other.id_;
    other.registry_.reset();
    other.id_ = 0;
  }
  return *this;
}

void PreDrawSubscription::Reset() {
  if (auto registry = registry_.lock()) {
    registry->Remove(id_);
  }
  registry_.reset();
  id_ = 0;
}

bool PreDrawSubscription::IsActive() const {
  auto registry = registry_.lock();
  return registry && registry->Contains(id_);
}

PreDrawDispatcher::PreDrawDispatcher()
    : registry_(std::make_shared<PreDrawSubscription::Registry>()) {}

PreDrawSubscription PreDrawDispatcher::Subscribe(Listener listener) {
  uint64_t id = registry_->next_id++;
  registry_->entries.push_back(PreDrawSubscription::Registry::Entry{
      id, std::make_shared<Listener>(std::move(listener))});
  return PreDrawSubscription{registry_, id};
}

bool PreDrawDispatcher::DispatchPreDraw() {
  // A listener may destroy this dispatcher, keep the registry alive locally.
  auto registry = registry_;
  // listeners may subscribe or unsubscribe while running, iterate a copy
  auto snapshot = registry->entries;

  bool proceed = true;
  for (const auto& entry : snapshot) {
    if (!registry->Contains(entry.id)) {
      continue;
    }
    if (!(*entry.listener)()) {
      proceed = false;
    }
  }
  return proceed;
}

size_t PreDrawDispatcher::ListenerCount() const {
  return registry_->entries.size();
}

}  // namespace frost
