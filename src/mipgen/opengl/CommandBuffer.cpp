/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/opengl/CommandBuffer.h>

#include <mipgen/opengl/IContext.h>
#include <mipgen/opengl/RenderCommandEncoder.h>

namespace mipgen::opengl {

namespace {
// glClientWaitSync is polled in slices so a lost context cannot block forever in one call
constexpr GLuint64 kWaitTimeoutNs = 1000000000ull;
} // namespace

CommandBuffer::CommandBuffer(std::shared_ptr<IContext> context, CommandBufferDesc desc) :
  ICommandBuffer(std::move(desc)), context_(std::move(context)) {}

CommandBuffer::~CommandBuffer() {
  if (fence_ != nullptr) {
    context_->deleteSync(fence_);
    fence_ = nullptr;
  }
}

std::unique_ptr<IRenderCommandEncoder> CommandBuffer::createRenderCommandEncoder(
    const RenderPassDesc& renderPass,
    const std::shared_ptr<IFramebuffer>& framebuffer,
    Result* outResult) {
  if (!framebuffer) {
    Result::setResult(outResult, Result::Code::ArgumentNull, "framebuffer is null");
    return nullptr;
  }
  auto encoder = RenderCommandEncoder::create(shared_from_this(), outResult);
  if (!encoder) {
    return nullptr;
  }
  Result result;
  encoder->beginEncoding(renderPass, framebuffer, &result);
  if (!result.isOk()) {
    Result::setResult(outResult, std::move(result));
    return nullptr;
  }
  Result::setOk(outResult);
  return encoder;
}

void CommandBuffer::insertFence() const {
  if (fence_ != nullptr) {
    MIPGEN_LOG_ERROR("Command buffer %s submitted twice\n", desc.debugName.c_str());
    context_->deleteSync(fence_);
  }
  fence_ = context_->fenceSync(GL_SYNC_GPU_COMMANDS_COMPLETE, 0);
}

void CommandBuffer::waitUntilCompleted() {
  if (fence_ == nullptr) {
    return;
  }
  GLenum status = GL_TIMEOUT_EXPIRED;
  while (status == GL_TIMEOUT_EXPIRED) {
    status = context_->clientWaitSync(fence_, GL_SYNC_FLUSH_COMMANDS_BIT, kWaitTimeoutNs);
  }
  if (status == GL_WAIT_FAILED) {
    MIPGEN_LOG_ERROR("glClientWaitSync failed for command buffer %s\n", desc.debugName.c_str());
  }
}

bool CommandBuffer::isCompleted() const {
  if (fence_ == nullptr) {
    return false;
  }
  GLint status = GL_UNSIGNALED;
  context_->getSynciv(fence_, GL_SYNC_STATUS, 1, nullptr, &status);
  return status == GL_SIGNALED;
}

IContext& CommandBuffer::getContext() const {
  return *context_;
}

} // namespace mipgen::opengl
