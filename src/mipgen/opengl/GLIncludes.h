/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/Macros.h>

#include <GLES3/gl3.h>
// Extension enums (BGRA8888, half float, KHR_debug). Entry points are loaded at runtime.
#include <GLES2/gl2ext.h>

#ifndef GL_BGRA_EXT
#define GL_BGRA_EXT 0x80E1
#endif
#ifndef GL_BGRA8_EXT
#define GL_BGRA8_EXT 0x93A1
#endif
#ifndef GL_DEBUG_SOURCE_APPLICATION_KHR
#define GL_DEBUG_SOURCE_APPLICATION_KHR 0x824A
#endif
#ifndef GL_TEXTURE_KHR
#define GL_TEXTURE_KHR 0x1702
#endif
#ifndef GL_PROGRAM_KHR
#define GL_PROGRAM_KHR 0x82E2
#endif
#ifndef GL_SHADER_KHR
#define GL_SHADER_KHR 0x82E1
#endif
#ifndef GL_SAMPLER_KHR
#define GL_SAMPLER_KHR 0x82E6
#endif
#ifndef GL_FRAMEBUFFER_KHR
#define GL_FRAMEBUFFER_KHR 0x8D40
#endif
