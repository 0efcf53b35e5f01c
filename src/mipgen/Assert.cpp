/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#define MIPGEN_COMMON_SKIP_CHECK
#include <mipgen/Assert.h>

#include <atomic>
#include <csignal>

namespace {
std::atomic<MipgenErrorHandlerFunc> sDebugAbortListener{nullptr};
std::atomic<MipgenErrorHandlerFunc> sSoftErrorHandler{nullptr};
std::atomic<bool> sDebugBreakEnabled{MIPGEN_DEBUG != 0};
} // namespace

void mipgenSetDebugAbortListener(MipgenErrorHandlerFunc listener) {
  sDebugAbortListener = listener;
}

MipgenErrorHandlerFunc mipgenGetDebugAbortListener() {
  return sDebugAbortListener;
}

void mipgenSetSoftErrorHandler(MipgenErrorHandlerFunc handler) {
  sSoftErrorHandler = handler;
}

MipgenErrorHandlerFunc mipgenGetSoftErrorHandler() {
  return sSoftErrorHandler;
}

namespace mipgen {

bool isDebugBreakEnabled() {
  return sDebugBreakEnabled;
}

void setDebugBreakEnabled(bool enabled) {
  sDebugBreakEnabled = enabled;
}

} // namespace mipgen

void mipgenDebugBreak() {
#if MIPGEN_DEBUG_BREAK_ENABLED && defined(SIGTRAP)
  if (mipgen::isDebugBreakEnabled()) {
    std::raise(SIGTRAP);
  }
#endif
}
