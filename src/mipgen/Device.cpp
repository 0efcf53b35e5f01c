/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/Device.h>

#include <algorithm>

namespace mipgen {

TextureDesc IDevice::sanitize(const TextureDesc& desc) const {
  TextureDesc sanitized = desc;
  if (desc.width == 0 || desc.height == 0 || desc.numMipLevels == 0) {
    sanitized.width = std::max(sanitized.width, 1u);
    sanitized.height = std::max(sanitized.height, 1u);
    sanitized.numMipLevels = std::max(sanitized.numMipLevels, 1u);
    MIPGEN_LOG_ERROR("width (%u), height (%u) and numMipLevels (%u) should be at least 1.\n",
                     desc.width,
                     desc.height,
                     desc.numMipLevels);
  }

  return sanitized;
}

} // namespace mipgen
