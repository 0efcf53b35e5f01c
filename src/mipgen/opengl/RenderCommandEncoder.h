/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/Framebuffer.h>
#include <mipgen/RenderCommandEncoder.h>
#include <mipgen/RenderPass.h>
#include <mipgen/opengl/GLIncludes.h>
#include <mipgen/opengl/WithContext.h>

namespace mipgen::opengl {

class CommandBuffer;
class Framebuffer;
class RenderPipelineState;

class RenderCommandEncoder final : public IRenderCommandEncoder, public WithContext {
 public:
  static std::unique_ptr<RenderCommandEncoder> create(
      const std::shared_ptr<CommandBuffer>& commandBuffer,
      Result* MIPGEN_NULLABLE outResult);

  ~RenderCommandEncoder() override;

 private:
  explicit RenderCommandEncoder(std::shared_ptr<CommandBuffer> commandBuffer);

 public:
  void beginEncoding(const RenderPassDesc& renderPass,
                     const std::shared_ptr<IFramebuffer>& framebuffer,
                     Result* MIPGEN_NULLABLE outResult);
  void endEncoding() override;

  void bindViewport(const Viewport& viewport) override;
  void bindRenderPipelineState(const std::shared_ptr<IRenderPipelineState>& pipelineState) override;

  void bindTexture(size_t index, ITexture* MIPGEN_NULLABLE texture) override;
  void bindSamplerState(size_t index, ISamplerState* MIPGEN_NULLABLE samplerState) override;
  void bindBindGroup(const BindGroup& bindGroup) override;

  void draw(size_t vertexCount) override;

 private:
  std::shared_ptr<CommandBuffer> commandBuffer_;
  std::shared_ptr<Framebuffer> framebuffer_;
  std::shared_ptr<RenderPipelineState> pipelineState_;
  uint32_t boundSamplerUnits_ = 0;
  bool hasDebugGroup_ = false;
  bool encoding_ = false;
};

} // namespace mipgen::opengl
