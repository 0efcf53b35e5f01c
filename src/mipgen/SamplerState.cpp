/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/SamplerState.h>

namespace mipgen {

bool SamplerStateDesc::operator==(const SamplerStateDesc& rhs) const {
  return (minFilter == rhs.minFilter) && (magFilter == rhs.magFilter) &&
         (mipFilter == rhs.mipFilter) && (addressModeU == rhs.addressModeU) &&
         (addressModeV == rhs.addressModeV) && (mipLodMin == rhs.mipLodMin) &&
         (mipLodMax == rhs.mipLodMax) && (debugName == rhs.debugName);
}

bool SamplerStateDesc::operator!=(const SamplerStateDesc& rhs) const {
  return !operator==(rhs);
}

} // namespace mipgen
