/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/Common.h>

namespace mipgen {

class BindGroup;
class IRenderPipelineState;
class ISamplerState;
class ITexture;

class IRenderCommandEncoder {
 public:
  virtual ~IRenderCommandEncoder() = default;

  /** @brief Completes the pass. No further commands may be encoded afterwards. */
  virtual void endEncoding() = 0;

  virtual void bindViewport(const Viewport& viewport) = 0;
  virtual void bindRenderPipelineState(
      const std::shared_ptr<IRenderPipelineState>& pipelineState) = 0;

  // OpenGL: 'index' is the texture unit
  virtual void bindTexture(size_t index, ITexture* MIPGEN_NULLABLE texture) = 0;
  virtual void bindSamplerState(size_t index, ISamplerState* MIPGEN_NULLABLE samplerState) = 0;

  /// Binds every texture/sampler pair of a bind group to consecutive units starting at 0.
  virtual void bindBindGroup(const BindGroup& bindGroup) = 0;

  /// Draws `vertexCount` vertices as a triangle list. Positions come from the bound vertex shader.
  virtual void draw(size_t vertexCount) = 0;
};

} // namespace mipgen
