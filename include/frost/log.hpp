// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_LOG_HPP
#define INCLUDE_FROST_LOG_HPP

#include <frost/macros.hpp>
#include <functional>

namespace frost {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarning = 2,
  kError = 3,
};

/**
 * Receives every formatted log line emitted by frost.
 *
 * The message does not contain a trailing new line.
 */
using LogCallback = std::function<void(LogLevel level, const char* message)>;

/**
 * Replace the process wide log sink. Passing an empty callback restores the
 * default sink which writes to stderr.
 */
void FROST_API SetLogCallback(LogCallback callback);

/**
 * Messages below this level are dropped. Default is LogLevel::kInfo.
 */
void FROST_API SetLogLevel(LogLevel level);

LogLevel FROST_API GetLogLevel();

}  // namespace frost

#endif  // INCLUDE_FROST_LOG_HPP
