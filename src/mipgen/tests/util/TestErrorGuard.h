/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/Core.h>

namespace mipgen::tests::util {
/// Sets a mipgen handler that will cause gtest to fail when a soft error is reported
class TestErrorGuard final {
 public:
  TestErrorGuard();

  virtual ~TestErrorGuard();

  static void ReportErrorHandler(const char* reason,
                                 const char* file,
                                 const char* func,
                                 int line,
                                 const char* message);

 private:
#if MIPGEN_SOFT_ERROR_ENABLED
  MipgenErrorHandlerFunc savedErrorHandler_;
#endif
};
} // namespace mipgen::tests::util
