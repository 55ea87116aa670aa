// Copyright 2021 The Lynx Authors. All rights reserved.
// Licensed under the Apache License Version 2.0 that can be found in the
// LICENSE file in the root directory of this source tree.

#ifndef INCLUDE_FROST_MACROS_HPP
#define INCLUDE_FROST_MACROS_HPP

#if defined(_WIN32) && defined(FROST_DLL)
#if defined(FROST_IMPLEMENTATION)
#define FROST_API __declspec(dllexport)
#else
#define FROST_API __declspec(dllimport)
#endif
#elif defined(FROST_DLL)
#define FROST_API __attribute__((visibility("default")))
#else
#define FROST_API
#endif

#define FROST_DISALLOW_COPY_AND_ASSIGN(TypeName) \
  TypeName(const TypeName&) = delete;            \
  TypeName& operator=(const TypeName&) = delete

#endif  // INCLUDE_FROST_MACROS_HPP
