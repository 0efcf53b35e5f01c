/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/Config.h>

#if defined(__GNUC__) || defined(__clang__)
#define MIPGEN_EXPORT __attribute__((visibility("default")))
#define MIPGEN_FUNCTION __PRETTY_FUNCTION__
#define MIPGEN_PRINTF_FORMAT(formatIndex, firstArg) \
  __attribute__((format(printf, formatIndex, firstArg)))
#else
#define MIPGEN_EXPORT
#define MIPGEN_FUNCTION __func__
#define MIPGEN_PRINTF_FORMAT(formatIndex, firstArg)
#endif

#if defined(__clang__)
#define MIPGEN_NULLABLE _Nullable
#define MIPGEN_NONNULL _Nonnull
#else
#define MIPGEN_NULLABLE
#define MIPGEN_NONNULL
#endif

// For switches that cover every enumerator but still need a return after them.
#define MIPGEN_UNREACHABLE_RETURN(value) \
  MIPGEN_DEBUG_ASSERT_NOT_REACHED();     \
  return value;

#define MIPGEN_ENUM_TO_STRING(enum, res) \
  case enum ::res:                       \
    return #res;
