// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include <frost/blur/pre_draw_dispatcher.hpp>
#include <memory>
#include <vector>

#include "gtest/gtest.h"

TEST(PreDrawDispatcher, RunsListenersInOrder) {
  frost::PreDrawDispatcher dispatcher;
  std::vector<int> calls;

  auto first = dispatcher.Subscribe([&]() {
    calls.push_back(1);
    return true;
  });
  auto second = dispatcher.Subscribe([&]() {
    calls.push_back(2);
    return true;
  });

  EXPECT_EQ(dispatcher.ListenerCount(), 2u);
  EXPECT_TRUE(dispatcher.DispatchPreDraw());
  EXPECT_EQ(calls, (std::vector<int>{1, 2}));
}

TEST(PreDrawDispatcher, ResetUnsubscribes) {
  frost::PreDrawDispatcher dispatcher;
  int calls = 0;

  auto subscription = dispatcher.Subscribe([&]() {
    calls++;
    return true;
  });
  EXPECT_TRUE(subscription.IsActive());

  subscription.Reset();
  EXPECT_FALSE(subscription.IsActive());
  EXPECT_EQ(dispatcher.ListenerCount(), 0u);

  dispatcher.DispatchPreDraw();
  EXPECT_EQ(calls, 0);

  // resetting twice is fine
  subscription.Reset();
}

TEST(PreDrawDispatcher, DestroyingHandleUnsubscribes) {
  frost::PreDrawDispatcher dispatcher;
  {
    auto subscription = dispatcher.Subscribe([]() { return true; });
    EXPECT_EQ(dispatcher.ListenerCount(), 1u);
  }
  EXPECT_EQ(dispatcher.ListenerCount(), 0u);
}

TEST(PreDrawDispatcher, MovedHandleKeepsSubscription) {
  frost::PreDrawDispatcher dispatcher;
  int calls = 0;

  frost::PreDrawSubscription outer;
  {
    auto inner = dispatcher.Subscribe([&]() {
      calls++;
      return true;
    });
    outer = std::move(inner);
    EXPECT_FALSE(inner.IsActive());
  }

  EXPECT_TRUE(outer.IsActive());
  dispatcher.DispatchPreDraw();
  EXPECT_EQ(calls, 1);
}

TEST(PreDrawDispatcher, FalseCancelsDrawButRunsEveryone) {
  frost::PreDrawDispatcher dispatcher;
  int calls = 0;

  auto cancel = dispatcher.Subscribe([&]() {
    calls++;
    return false;
  });
  auto other = dispatcher.Subscribe([&]() {
    calls++;
    return true;
  });

  EXPECT_FALSE(dispatcher.DispatchPreDraw());
  EXPECT_EQ(calls, 2);
}

TEST(PreDrawDispatcher, ListenerRemovedDuringDispatchIsSkipped) {
  frost::PreDrawDispatcher dispatcher;
  frost::PreDrawSubscription second;
  int second_calls = 0;

  auto first = dispatcher.Subscribe([&]() {
    second.Reset();
    return true;
  });
  second = dispatcher.Subscribe([&]() {
    second_calls++;
    return true;
  });

  dispatcher.DispatchPreDraw();
  EXPECT_EQ(second_calls, 0);
  EXPECT_EQ(dispatcher.ListenerCount(), 1u);
}

TEST(PreDrawDispatcher, ListenerAddedDuringDispatchRunsNextPass) {
  frost::PreDrawDispatcher dispatcher;
  frost::PreDrawSubscription late;
  int late_calls = 0;

  auto first = dispatcher.Subscribe([&]() {
    if (!late.IsActive()) {
      late = dispatcher.Subscribe([&]() {
        late_calls++;
        return true;
      });
    }
    return true;
  });

  dispatcher.DispatchPreDraw();
  EXPECT_EQ(late_calls, 0);
  dispatcher.DispatchPreDraw();
  EXPECT_EQ(late_calls, 1);
}

TEST(PreDrawDispatcher, HandleMayOutliveDispatcher) {
  frost::PreDrawSubscription subscription;
  {
    frost::PreDrawDispatcher dispatcher;
    subscription = dispatcher.Subscribe([]() { return true; });
    EXPECT_TRUE(subscription.IsActive());
  }
  EXPECT_FALSE(subscription.IsActive());
  subscription.Reset();
}

TEST(PreDrawDispatcher, ListenerMayDestroyDispatcher) {
  frost::PreDrawSubscription first;
  frost::PreDrawSubscription second;
  auto dispatcher = std::make_unique<frost::PreDrawDispatcher>();
  int second_calls = 0;

  first = dispatcher->Subscribe([&]() {
    dispatcher.reset();
    return true;
  });
  second = dispatcher->Subscribe([&]() {
    second_calls++;
    return true;
  });

  EXPECT_TRUE(dispatcher->DispatchPreDraw());
  EXPECT_EQ(dispatcher, nullptr);
  // the pass finishes with the listeners registered when it started
  EXPECT_EQ(second_calls, 1);
  EXPECT_FALSE(first.IsActive());
  EXPECT_FALSE(second.IsActive());
}
