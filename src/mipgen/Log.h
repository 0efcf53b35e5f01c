/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#if !defined(MIPGEN_COMMON_H) && !defined(MIPGEN_COMMON_SKIP_CHECK)
#error "Please, include <mipgen/Common.h> instead"
#endif

#include <cstdarg>
#include <mipgen/Macros.h>
#include <string>

enum MipgenLogLevel {
  MipgenLogError = 1,
  MipgenLogWarning,
  MipgenLogInfo,
  MipgenLogDebug,
};

///--------------------------------------
/// MARK: - Logging
//
// Messages are printf-formatted once, then handed to the installed handler. The default handler
// writes errors to stderr and everything else to stdout.

MIPGEN_EXPORT void MipgenLog(MipgenLogLevel logLevel, const char* MIPGEN_NONNULL format, ...)
    MIPGEN_PRINTF_FORMAT(2, 3);
MIPGEN_EXPORT void MipgenLogV(MipgenLogLevel logLevel,
                              const char* MIPGEN_NONNULL format,
                              va_list ap);
/// Drops the message if an identical one was already logged by this function.
MIPGEN_EXPORT void MipgenLogOnce(MipgenLogLevel logLevel, const char* MIPGEN_NONNULL format, ...)
    MIPGEN_PRINTF_FORMAT(2, 3);

using MipgenLogHandlerFunc = void (*)(MipgenLogLevel logLevel, const char* MIPGEN_NONNULL message);

MIPGEN_EXPORT void MipgenLogDefaultHandler(MipgenLogLevel logLevel,
                                           const char* MIPGEN_NONNULL message);
/// Installs `handler`; null restores MipgenLogDefaultHandler.
MIPGEN_EXPORT void MipgenLogSetHandler(MipgenLogHandlerFunc MIPGEN_NULLABLE handler);
MIPGEN_EXPORT MipgenLogHandlerFunc MIPGEN_NONNULL MipgenLogGetHandler();

namespace mipgen {
/// printf-style formatting into a string; an invalid format yields an empty string.
std::string vformat(const char* MIPGEN_NONNULL format, va_list ap);
} // namespace mipgen

///--------------------------------------
/// MARK: - Macros

#if MIPGEN_DEBUG || defined(MIPGEN_FORCE_ENABLE_LOGS)
#define MIPGEN_LOG_ERROR(format, ...) MipgenLog(MipgenLogError, (format), ##__VA_ARGS__)
#define MIPGEN_LOG_ERROR_ONCE(format, ...) MipgenLogOnce(MipgenLogError, (format), ##__VA_ARGS__)
#define MIPGEN_LOG_WARNING(format, ...) MipgenLog(MipgenLogWarning, (format), ##__VA_ARGS__)
#define MIPGEN_LOG_INFO(format, ...) MipgenLog(MipgenLogInfo, (format), ##__VA_ARGS__)
#define MIPGEN_LOG_INFO_ONCE(format, ...) MipgenLogOnce(MipgenLogInfo, (format), ##__VA_ARGS__)
#define MIPGEN_LOG_DEBUG(format, ...) MipgenLog(MipgenLogDebug, (format), ##__VA_ARGS__)
#else
#define MIPGEN_LOG_ERROR(format, ...) static_cast<void>(0)
#define MIPGEN_LOG_ERROR_ONCE(format, ...) static_cast<void>(0)
#define MIPGEN_LOG_WARNING(format, ...) static_cast<void>(0)
#define MIPGEN_LOG_INFO(format, ...) static_cast<void>(0)
#define MIPGEN_LOG_INFO_ONCE(format, ...) static_cast<void>(0)
#define MIPGEN_LOG_DEBUG(format, ...) static_cast<void>(0)
#endif
