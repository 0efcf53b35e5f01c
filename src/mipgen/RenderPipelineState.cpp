/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/RenderPipelineState.h>

namespace mipgen {

bool RenderPipelineDesc::TargetDesc::ColorAttachment::operator==(
    const ColorAttachment& other) const {
  return textureFormat == other.textureFormat && colorWriteMask == other.colorWriteMask;
}

bool RenderPipelineDesc::TargetDesc::ColorAttachment::operator!=(
    const ColorAttachment& other) const {
  return !(*this == other);
}

bool RenderPipelineDesc::TargetDesc::operator==(const TargetDesc& other) const {
  return colorAttachments == other.colorAttachments;
}

bool RenderPipelineDesc::TargetDesc::operator!=(const TargetDesc& other) const {
  return !(*this == other);
}

bool RenderPipelineDesc::operator==(const RenderPipelineDesc& other) const {
  return shaderStages == other.shaderStages && targetDesc == other.targetDesc &&
         fragmentUnitSamplerMap == other.fragmentUnitSamplerMap && debugName == other.debugName;
}

bool RenderPipelineDesc::operator!=(const RenderPipelineDesc& other) const {
  return !(*this == other);
}

} // namespace mipgen
