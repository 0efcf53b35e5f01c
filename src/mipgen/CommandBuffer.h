/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/Common.h>
#include <mipgen/Framebuffer.h>
#include <mipgen/RenderCommandEncoder.h>

namespace mipgen {

struct RenderPassDesc;

struct CommandBufferDesc {
  std::string debugName;
};

/**
 * Struct containing data about the command buffer usage. Currently used to track the number of draw
 * calls performed by this command buffer.
 */
struct CommandBufferStatistics {
  uint32_t currentDrawCount = 0;
};

/**
 * @brief ICommandBuffer represents an object which accepts and stores commands to be executed on
 * the GPU.
 *
 * Render passes are added to the CommandBuffer using a RenderCommandEncoder. Once every encoder is
 * finished, the buffer is handed to ICommandQueue::submit().
 *
 * ICommandBuffer also includes methods for synchronizing CPU code execution based on when the GPU
 * executes the commands encoded in the CommandBuffer.
 */
class ICommandBuffer {
 public:
  explicit ICommandBuffer(CommandBufferDesc iDesc) : desc(std::move(iDesc)) {}
  virtual ~ICommandBuffer() = default;

  /**
   * @brief Create a RenderCommandEncoder for encoding rendering commands into this CommandBuffer.
   * @returns a pointer to the RenderCommandEncoder
   */
  virtual std::unique_ptr<IRenderCommandEncoder> createRenderCommandEncoder(
      const RenderPassDesc& renderPass,
      const std::shared_ptr<IFramebuffer>& framebuffer,
      Result* MIPGEN_NULLABLE outResult = nullptr) = 0;

  /**
   * @brief Blocks execution of the current thread until the commands encoded in this CommandBuffer
   * have been executed on the GPU. Returns immediately if the buffer was never submitted.
   */
  virtual void waitUntilCompleted() = 0;

  /**
   * @brief Non-blocking check of whether the submitted work has finished on the GPU.
   */
  [[nodiscard]] virtual bool isCompleted() const = 0;

  /**
   * @returns the number of draw operations tracked by this CommandBuffer.
   */
  [[nodiscard]] uint32_t getCurrentDrawCount() const {
    return statistics_.currentDrawCount;
  }

  /**
   * @brief Increment a counter representing the number of draw operations tracked by this
   * CommandBuffer.
   */
  void incrementCurrentDrawCount() {
    statistics_.currentDrawCount++;
  }

  const CommandBufferDesc desc;

 private:
  CommandBufferStatistics statistics_;
};

} // namespace mipgen
