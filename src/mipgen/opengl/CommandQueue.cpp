/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/opengl/CommandQueue.h>

#include <mipgen/opengl/CommandBuffer.h>
#include <mipgen/opengl/IContext.h>

namespace mipgen::opengl {

CommandQueue::CommandQueue(std::shared_ptr<IContext> context) : context_(std::move(context)) {}

std::shared_ptr<ICommandBuffer> CommandQueue::createCommandBuffer(const CommandBufferDesc& desc,
                                                                  Result* outResult) {
  if (context_ == nullptr) {
    Result::setResult(outResult, Result::Code::RuntimeError, "There is no context set");
    return nullptr;
  }

  auto commandBuffer = std::make_shared<CommandBuffer>(context_, desc);
  activeCommandBuffers_++;
  Result::setOk(outResult);

  return commandBuffer;
}

SubmitHandle CommandQueue::submit(const ICommandBuffer& commandBuffer, bool endOfFrame) {
  const auto& cb = static_cast<const CommandBuffer&>(commandBuffer);
  incrementDrawCount(cb.getCurrentDrawCount());

  // GL commands were issued while encoding; the fence marks the end of this buffer's work
  cb.insertFence();
  context_->flush();

  if (activeCommandBuffers_ > 0) {
    activeCommandBuffers_--;
  }
  if (endOfFrame) {
    endFrame();
  }

  return ++lastSubmitHandle_;
}

} // namespace mipgen::opengl
