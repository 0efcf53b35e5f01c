/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "Recording.h"

namespace mipgen::tests::util::recording {

class CommandQueue final : public ICommandQueue {
 public:
  explicit CommandQueue(std::shared_ptr<Recording> recording);

  std::shared_ptr<ICommandBuffer> createCommandBuffer(const CommandBufferDesc& desc,
                                                      Result* MIPGEN_NULLABLE outResult) override;
  SubmitHandle submit(const ICommandBuffer& commandBuffer, bool endOfFrame) override;

 private:
  std::shared_ptr<Recording> recording_;
  SubmitHandle lastSubmitHandle_ = 0;
};

class CommandBuffer final : public ICommandBuffer {
 public:
  CommandBuffer(std::shared_ptr<Recording> recording, CommandBufferDesc desc);

  std::unique_ptr<IRenderCommandEncoder> createRenderCommandEncoder(
      const RenderPassDesc& renderPass,
      const std::shared_ptr<IFramebuffer>& framebuffer,
      Result* MIPGEN_NULLABLE outResult) override;

  void waitUntilCompleted() override {}
  [[nodiscard]] bool isCompleted() const override {
    return submitted_;
  }

  void markSubmitted() const {
    submitted_ = true;
  }

 private:
  std::shared_ptr<Recording> recording_;
  mutable bool submitted_ = false;
};

/// Records the state a pass was drawn with. The pass is appended to the recording on
/// endEncoding().
class RenderCommandEncoder final : public IRenderCommandEncoder {
 public:
  RenderCommandEncoder(CommandBuffer& commandBuffer,
                       std::shared_ptr<Recording> recording,
                       RecordedPass pass);

  void endEncoding() override;
  void bindViewport(const Viewport& viewport) override;
  void bindRenderPipelineState(
      const std::shared_ptr<IRenderPipelineState>& pipelineState) override;
  void bindTexture(size_t index, ITexture* MIPGEN_NULLABLE texture) override;
  void bindSamplerState(size_t index, ISamplerState* MIPGEN_NULLABLE samplerState) override;
  void bindBindGroup(const BindGroup& bindGroup) override;
  void draw(size_t vertexCount) override;

 private:
  CommandBuffer& commandBuffer_;
  std::shared_ptr<Recording> recording_;
  RecordedPass pass_;
  bool ended_ = false;
};

} // namespace mipgen::tests::util::recording
