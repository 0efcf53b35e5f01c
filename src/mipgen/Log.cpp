/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#define MIPGEN_COMMON_SKIP_CHECK

#include <cstdarg>
#include <cstdio>
#include <mipgen/Core.h>
#include <mutex>
#include <string>
#include <unordered_set>

namespace {
MipgenLogHandlerFunc& currentHandler() {
  static MipgenLogHandlerFunc sHandler = MipgenLogDefaultHandler;
  return sHandler;
}
} // namespace

std::string mipgen::vformat(const char* format, va_list ap) {
  va_list apCopy;
  va_copy(apCopy, ap);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
#endif
  const int length = std::vsnprintf(nullptr, 0, format, apCopy);
  va_end(apCopy);
  if (length <= 0) {
    return {};
  }
  std::string message(static_cast<size_t>(length), '\0');
  std::vsnprintf(message.data(), message.size() + 1, format, ap);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
  return message;
}

void MipgenLog(MipgenLogLevel logLevel, const char* format, ...) {
  va_list ap;
  va_start(ap, format);
  MipgenLogV(logLevel, format, ap);
  va_end(ap);
}

void MipgenLogV(MipgenLogLevel logLevel, const char* format, va_list ap) {
  const std::string message = mipgen::vformat(format, ap);
  currentHandler()(logLevel, message.c_str());
}

void MipgenLogOnce(MipgenLogLevel logLevel, const char* format, ...) {
  static std::mutex sLoggedMutex;
  static std::unordered_set<std::string> sLogged;

  va_list ap;
  va_start(ap, format);
  std::string message = mipgen::vformat(format, ap);
  va_end(ap);

  {
    const std::lock_guard<std::mutex> guard(sLoggedMutex);
    if (!sLogged.insert(message).second) {
      return;
    }
  }
  currentHandler()(logLevel, message.c_str());
}

void MipgenLogDefaultHandler(MipgenLogLevel logLevel, const char* message) {
  std::fputs(message, logLevel == MipgenLogError ? stderr : stdout);
}

void MipgenLogSetHandler(MipgenLogHandlerFunc handler) {
  currentHandler() = handler != nullptr ? handler : MipgenLogDefaultHandler;
}

MipgenLogHandlerFunc MipgenLogGetHandler() {
  return currentHandler();
}
