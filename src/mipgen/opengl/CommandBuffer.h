/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/CommandBuffer.h>
#include <mipgen/opengl/GLIncludes.h>

namespace mipgen::opengl {

class IContext;

/**
 * @brief Commands are executed on the current context as they are encoded. Submission inserts a
 * fence that completion queries wait on.
 */
class CommandBuffer final : public ICommandBuffer,
                            public std::enable_shared_from_this<CommandBuffer> {
 public:
  CommandBuffer(std::shared_ptr<IContext> context, CommandBufferDesc desc);
  ~CommandBuffer() override;

  std::unique_ptr<IRenderCommandEncoder> createRenderCommandEncoder(
      const RenderPassDesc& renderPass,
      const std::shared_ptr<IFramebuffer>& framebuffer,
      Result* MIPGEN_NULLABLE outResult) override;

  void waitUntilCompleted() override;
  [[nodiscard]] bool isCompleted() const override;

  [[nodiscard]] IContext& getContext() const;

  // Called by CommandQueue::submit
  void insertFence() const;

 private:
  std::shared_ptr<IContext> context_;
  mutable GLsync fence_ = nullptr;
};

} // namespace mipgen::opengl
