// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#include "src/logging.hpp"

#include <array>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <utility>

#include "src/utils/no_destructor.hpp"

namespace frost {

namespace {

constexpr size_t kMaxLogLength = 1024;

struct LogState {
  std::mutex mutex;
  LogCallback callback;
};

LogState* GetLogState() {
  static NoDestructor<LogState> state;
  return state.get();
}

std::atomic<int> g_log_level{static_cast<int>(LogLevel::kInfo)};

const char* LevelTag(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "D";
    case LogLevel::kInfo:
      return "I";
    case LogLevel::kWarning:
      return "W";
    case LogLevel::kError:
      return "E";
  }
  return "?";
}

}  // namespace

void SetLogCallback(LogCallback callback) {
  auto state = GetLogState();
  std::lock_guard<std::mutex> lock(state->mutex);
  state->callback = std::move(callback);
}

void SetLogLevel(LogLevel level) {
  g_log_level.store(static_cast<int>(level));
}

LogLevel GetLogLevel() { return static_cast<LogLevel>(g_log_level.load()); }

void LogMessage(LogLevel level, const char* format, ...) {
  if (static_cast<int>(level) < g_log_level.load()) {
    return;
  }

  std::array<char, kMaxLogLength> buffer = {};
  va_list args;
  va_start(args, format);
  std::vsnprintf(buffer.data(), buffer.size(), format, args);
  va_end(args);

  // the sink may log again, so it runs outside the lock
  LogCallback callback;
  {
    auto state = GetLogState();
    std::lock_guard<std::mutex> lock(state->mutex);
    callback = state->callback;
  }

  if (callback) {
    callback(level, buffer.data());
    return;
  }

  std::fprintf(stderr, "[frost][%s] %s\n", LevelTag(level), buffer.data());
}

}  // namespace frost
