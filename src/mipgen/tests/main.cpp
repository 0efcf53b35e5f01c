/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <mipgen/Common.h>

static void signalHandler(int signum) {
  std::printf("CRASH: Signal %d caught\n", signum);
  std::_Exit(signum);
}

int main(int argc, char** argv) {
  // Install basic signal handler for early crash diagnostics
  std::signal(SIGSEGV, signalHandler);

  // Contract violations exercised by the tests must log, not trap.
  mipgen::setDebugBreakEnabled(false);

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
