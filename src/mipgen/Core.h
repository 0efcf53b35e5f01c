/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#ifndef MIPGEN_CORE_H
#define MIPGEN_CORE_H

/**
 * @brief Core.h is a minimal header set for non-graphics utilities (logging, assert)
 */

// Define macros to disable checks
#if !defined(MIPGEN_COMMON_SKIP_CHECK)
#define MIPGEN_COMMON_SKIP_CHECK 1
#define MIPGEN_CORE_H_COMMON_SKIP_CHECK 1 // Marker so we know to undefine at end of header
#endif // !defined(MIPGEN_COMMON_SKIP_CHECK)

#include <mipgen/Assert.h>
#include <mipgen/Log.h>
#include <mipgen/Macros.h>

// Undefine macros that are local to this header
#if defined(MIPGEN_CORE_H_COMMON_SKIP_CHECK)
#undef MIPGEN_COMMON_SKIP_CHECK
#undef MIPGEN_CORE_H_COMMON_SKIP_CHECK
#endif // defined(MIPGEN_CORE_H_COMMON_SKIP_CHECK)

#endif // MIPGEN_CORE_H
