// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef SRC_LOGGING_HPP
#define SRC_LOGGING_HPP

#include <frost/log.hpp>

namespace frost {

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 2, 3)))
#endif
void LogMessage(LogLevel level, const char* format, ...);

}  // namespace frost

#ifdef FROST_LOG

#define LOGD(...) ::frost::LogMessage(::frost::LogLevel::kDebug, __VA_ARGS__)
#define LOGI(...) ::frost::LogMessage(::frost::LogLevel::kInfo, __VA_ARGS__)
#define LOGW(...) ::frost::LogMessage(::frost::LogLevel::kWarning, __VA_ARGS__)
#define LOGE(...) ::frost::LogMessage(::frost::LogLevel::kError, __VA_ARGS__)

#else

#define LOGD(...)
#define LOGI(...)
#define LOGW(...)
#define LOGE(...)

#endif  // FROST_LOG

#endif  // SRC_LOGGING_HPP
