/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/CommandQueue.h>

namespace mipgen::opengl {

class IContext;

class CommandQueue final : public ICommandQueue {
 public:
  explicit CommandQueue(std::shared_ptr<IContext> context);

  std::shared_ptr<ICommandBuffer> createCommandBuffer(const CommandBufferDesc& desc,
                                                      Result* MIPGEN_NULLABLE outResult) override;
  SubmitHandle submit(const ICommandBuffer& commandBuffer, bool endOfFrame = false) override;

 private:
  std::shared_ptr<IContext> context_;
  uint32_t activeCommandBuffers_ = 0;
  SubmitHandle lastSubmitHandle_ = 0;
};

} // namespace mipgen::opengl
