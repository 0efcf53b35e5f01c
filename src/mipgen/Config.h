/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

///--------------------------------------
/// MARK: - Backends
//
// Engine code never includes backend headers; it is handed an IHWDeviceProvider instead.
#if defined(MIPGEN_BACKEND_ENABLE_OPENGL)
#define MIPGEN_BACKEND_OPENGL 1
#else
#define MIPGEN_BACKEND_OPENGL 0
#endif

///--------------------------------------
/// MARK: - Diagnostics
//
// Each switch may be preset by the build system.
//
//   MIPGEN_DEBUG                 debug build; follows NDEBUG by default
//   MIPGEN_DEBUG_ABORT_ENABLED   failed MIPGEN_DEBUG_* checks are reported
//   MIPGEN_DEBUG_BREAK_ENABLED   reported checks also raise SIGTRAP
//   MIPGEN_SOFT_ERROR_ENABLED    MIPGEN_SOFT_* failures reach the soft error handler

#if !defined(MIPGEN_DEBUG)
#if defined(NDEBUG)
#define MIPGEN_DEBUG 0
#else
#define MIPGEN_DEBUG 1
#endif
#endif

#if !defined(MIPGEN_DEBUG_ABORT_ENABLED)
#define MIPGEN_DEBUG_ABORT_ENABLED MIPGEN_DEBUG
#endif

#if !defined(MIPGEN_DEBUG_BREAK_ENABLED)
#define MIPGEN_DEBUG_BREAK_ENABLED MIPGEN_DEBUG
#endif

// Soft errors stay on in release builds so embedders can collect them.
#if !defined(MIPGEN_SOFT_ERROR_ENABLED)
#define MIPGEN_SOFT_ERROR_ENABLED 1
#endif
