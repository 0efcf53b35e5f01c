/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once
#include <cstdint>

namespace mipgen {
/**
 * Format names follow the pattern
 *
 *  TextureFormat::[component list]_[storage type][array element bit width]
 *
 * Component labels:
 *  R, G, B, A - color channels
 *  L          - luminance
 *  S          - stencil (when not followed by RGB or RGBA), non-linear (when followed by RGBA)
 *  Z          - depth
 *
 * Storage types:
 *  F: float
 *  UInt: unsigned integer
 *  UNorm: unsigned normalized integer
 *
 * Only uncompressed formats are listed. Mip chains are produced by rendering into each level,
 * which block-compressed formats cannot be targets of.
 */
enum class TextureFormat : uint8_t {
  Invalid = 0,

  // 8 bpp
  A_UNorm8,
  L_UNorm8,
  R_UNorm8,

  // 16 bpp
  R_F16,
  R_UInt16,
  LA_UNorm8,
  RG_UNorm8,

  // 32 bpp
  RGBA_UNorm8,
  BGRA_UNorm8,
  RGBA_SRGB,
  BGRA_SRGB,
  RG_F16,
  RG_UInt16,
  RGB10_A2_UNorm_Rev,
  R_F32,

  // 64 bpp
  RGBA_F16,
  RG_F32,

  // 128 bpp
  RGBA_UInt32,
  RGBA_F32,

  // Depth and Stencil formats
  Z_UNorm16,
  Z_UNorm24,
  S8_UInt_Z24_UNorm,
  S_UInt8,
};
} // namespace mipgen
