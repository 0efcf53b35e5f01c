/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/Common.h>

namespace mipgen {

struct CommandBufferDesc;
class ICommandBuffer;

/**
 * This is a placeholder for future use
 */
struct CommandQueueDesc {};

/// GPU Fence Handle. 0 means "nothing submitted".
using SubmitHandle = uint64_t;

/**
 * Creates command buffers and submits them to the device's only queue. Buffers execute in
 * submission order.
 */
class ICommandQueue {
 public:
  virtual ~ICommandQueue() = default;

  virtual std::shared_ptr<ICommandBuffer> createCommandBuffer(
      const CommandBufferDesc& desc,
      Result* MIPGEN_NULLABLE outResult) = 0;
  virtual SubmitHandle submit(const ICommandBuffer& commandBuffer, bool endOfFrame = false) = 0;

  [[nodiscard]] uint32_t getLastFrameDrawCount() const {
    return lastFrameDrawCount_;
  }

  void endFrame() {
    lastFrameDrawCount_ = currentDrawCount_;
    currentDrawCount_ = 0;
  }

 protected:
  void incrementDrawCount(uint32_t newDrawCount) {
    currentDrawCount_ += newDrawCount;
  }

 private:
  uint32_t currentDrawCount_ = 0;
  uint32_t lastFrameDrawCount_ = 0;
};

} // namespace mipgen
