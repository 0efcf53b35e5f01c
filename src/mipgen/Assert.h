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
#include <mipgen/Log.h>
#include <mipgen/Macros.h>
#include <string>

///--------------------------------------
/// MARK: - Assert

// A failed debug check is logged with its location, handed to the abort listener and then raises
// SIGTRAP unless debug break is off. Execution continues afterwards.
//
//   MIPGEN_DEBUG_ASSERT(texture);
//   MIPGEN_DEBUG_ASSERT(level < numLevels, "Level %u out of range (%u)", level, numLevels);
//
// MIPGEN_DEBUG_VERIFY and MIPGEN_DEBUG_VERIFY_NOT evaluate to their condition in every build, so
// they belong inside `if` statements:
//
//   if (!MIPGEN_DEBUG_VERIFY(sampler_)) {
//     Result::setResult(outResult, Result::Code::NotInitialized);
//     return {};
//   }

/// `message` is the formatted message when one was given, otherwise the failed expression.
using MipgenErrorHandlerFunc = void (*)(const char* MIPGEN_NONNULL reason,
                                        const char* MIPGEN_NONNULL file,
                                        const char* MIPGEN_NONNULL func,
                                        int line,
                                        const char* MIPGEN_NONNULL message);

MIPGEN_EXPORT void mipgenDebugBreak();

MIPGEN_EXPORT void mipgenSetDebugAbortListener(MipgenErrorHandlerFunc MIPGEN_NULLABLE listener);
MIPGEN_EXPORT MipgenErrorHandlerFunc MIPGEN_NULLABLE mipgenGetDebugAbortListener();

MIPGEN_EXPORT void mipgenSetSoftErrorHandler(MipgenErrorHandlerFunc MIPGEN_NULLABLE handler);
MIPGEN_EXPORT MipgenErrorHandlerFunc MIPGEN_NULLABLE mipgenGetSoftErrorHandler();

namespace mipgen {
bool isDebugBreakEnabled();
void setDebugBreakEnabled(bool enabled);

namespace detail {
[[nodiscard]] inline bool ensureNoDiscard(bool cond) {
  return cond;
}

inline std::string checkMessage(const char* MIPGEN_NULLABLE expression,
                                const char* MIPGEN_NULLABLE format,
                                va_list ap) {
  if (format != nullptr) {
    return vformat(format, ap);
  }
  return expression != nullptr ? expression : "";
}

inline void reportDebugAbort([[maybe_unused]] const char* reason,
                             [[maybe_unused]] const char* file,
                             [[maybe_unused]] const char* func,
                             [[maybe_unused]] int line,
                             [[maybe_unused]] const std::string& message) {
#if MIPGEN_DEBUG_ABORT_ENABLED
  if (auto listener = mipgenGetDebugAbortListener()) {
    listener(reason, file, func, line, message.c_str());
  }
  MipgenLog(MipgenLogError,
            "[mipgen] %s in '%s' (%s:%d): %s\n",
            reason,
            func,
            file,
            line,
            message.c_str());
  mipgenDebugBreak();
#endif // MIPGEN_DEBUG_ABORT_ENABLED
}

// Both return false so they can sit on the failing side of a conditional expression.
[[nodiscard]] inline bool debugAbort(const char* reason,
                                     const char* file,
                                     const char* func,
                                     int line,
                                     const char* MIPGEN_NULLABLE expression,
                                     const char* MIPGEN_NULLABLE format = nullptr,
                                     ...) {
  va_list ap;
  va_start(ap, format);
  const std::string message = checkMessage(expression, format, ap);
  va_end(ap);
  reportDebugAbort(reason, file, func, line, message);
  return false;
}

[[nodiscard]] inline bool softError(const char* reason,
                                    const char* file,
                                    const char* func,
                                    int line,
                                    const char* MIPGEN_NULLABLE expression,
                                    const char* MIPGEN_NULLABLE format = nullptr,
                                    ...) {
  va_list ap;
  va_start(ap, format);
  const std::string message = checkMessage(expression, format, ap);
  va_end(ap);
  reportDebugAbort(reason, file, func, line, message);
#if MIPGEN_SOFT_ERROR_ENABLED
  if (auto handler = mipgenGetSoftErrorHandler()) {
    handler(reason, file, func, line, message.c_str());
  }
#endif // MIPGEN_SOFT_ERROR_ENABLED
  return false;
}
} // namespace detail
} // namespace mipgen

#if MIPGEN_DEBUG_ABORT_ENABLED

#define MIPGEN_DEBUG_CHECK_IMPL(cond, reason, expression, ...) \
  ((cond) ? ::mipgen::detail::ensureNoDiscard(true)            \
          : ::mipgen::detail::debugAbort(                      \
                reason, __FILE__, MIPGEN_FUNCTION, __LINE__, expression, ##__VA_ARGS__))

// MIPGEN_DEBUG_ASSERT(cond) or MIPGEN_DEBUG_ASSERT(cond, format, ...)
#define MIPGEN_DEBUG_ASSERT(cond, ...) \
  static_cast<void>(MIPGEN_DEBUG_CHECK_IMPL(!!(cond), "Assert failed", #cond, ##__VA_ARGS__))
#define MIPGEN_DEBUG_VERIFY(cond, ...) \
  MIPGEN_DEBUG_CHECK_IMPL(!!(cond), "Verify failed", #cond, ##__VA_ARGS__)
// True when `cond` holds, which is the case that gets reported.
#define MIPGEN_DEBUG_VERIFY_NOT(cond, ...) \
  (!MIPGEN_DEBUG_CHECK_IMPL(!(cond), "Verify failed", "!(" #cond ")", ##__VA_ARGS__))
#define MIPGEN_DEBUG_ABORT(format, ...)                                          \
  static_cast<void>(::mipgen::detail::debugAbort(                                \
      "Abort requested", __FILE__, MIPGEN_FUNCTION, __LINE__, nullptr, (format), \
      ##__VA_ARGS__))

#else

#define MIPGEN_DEBUG_ASSERT(cond, ...) static_cast<void>(0)
#define MIPGEN_DEBUG_VERIFY(cond, ...) ::mipgen::detail::ensureNoDiscard(!!(cond))
#define MIPGEN_DEBUG_VERIFY_NOT(cond, ...) ::mipgen::detail::ensureNoDiscard(!!(cond))
#define MIPGEN_DEBUG_ABORT(format, ...) static_cast<void>(0)

#endif // MIPGEN_DEBUG_ABORT_ENABLED

#define MIPGEN_DEBUG_ASSERT_NOT_REACHED() MIPGEN_DEBUG_ABORT("Code should NOT be reached")
#define MIPGEN_DEBUG_ASSERT_NOT_IMPLEMENTED() MIPGEN_DEBUG_ABORT("Code NOT implemented")

///--------------------------------------
/// MARK: - Soft errors
//
// Soft errors are failures the library recovers from but embedders may want to collect. They go
// through the debug abort path and then to the soft error handler.

#if MIPGEN_SOFT_ERROR_ENABLED

#define MIPGEN_SOFT_ERROR(format, ...)                                      \
  static_cast<void>(::mipgen::detail::softError(                            \
      "Soft error", __FILE__, MIPGEN_FUNCTION, __LINE__, nullptr, (format), \
      ##__VA_ARGS__))
// MIPGEN_SOFT_ASSERT(cond) or MIPGEN_SOFT_ASSERT(cond, format, ...)
#define MIPGEN_SOFT_ASSERT(cond, ...)                                                    \
  static_cast<void>(                                                                     \
      (!!(cond)) ? true                                                                  \
                 : ::mipgen::detail::softError(                                          \
                       "Soft assert failed", __FILE__, MIPGEN_FUNCTION, __LINE__, #cond, \
                       ##__VA_ARGS__))

#else

#define MIPGEN_SOFT_ERROR(format, ...) static_cast<void>(0)
#define MIPGEN_SOFT_ASSERT(cond, ...) static_cast<void>(0)

#endif // MIPGEN_SOFT_ERROR_ENABLED
