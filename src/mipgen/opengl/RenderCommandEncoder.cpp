/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/opengl/RenderCommandEncoder.h>

#include <algorithm>
#include <mipgen/BindGroup.h>
#include <mipgen/opengl/CommandBuffer.h>
#include <mipgen/opengl/Framebuffer.h>
#include <mipgen/opengl/IContext.h>
#include <mipgen/opengl/RenderPipelineState.h>
#include <mipgen/opengl/SamplerState.h>
#include <mipgen/opengl/Texture.h>

namespace mipgen::opengl {

RenderCommandEncoder::RenderCommandEncoder(std::shared_ptr<CommandBuffer> commandBuffer) :
  WithContext(commandBuffer->getContext()), commandBuffer_(std::move(commandBuffer)) {}

std::unique_ptr<RenderCommandEncoder> RenderCommandEncoder::create(
    const std::shared_ptr<CommandBuffer>& commandBuffer,
    Result* outResult) {
  if (!commandBuffer) {
    Result::setResult(outResult, Result::Code::ArgumentNull, "commandBuffer is null");
    return nullptr;
  }
  Result::setOk(outResult);
  return std::unique_ptr<RenderCommandEncoder>(new RenderCommandEncoder(commandBuffer));
}

RenderCommandEncoder::~RenderCommandEncoder() {
  MIPGEN_DEBUG_ASSERT(!encoding_, "Encoder destroyed before endEncoding()");
}

void RenderCommandEncoder::beginEncoding(const RenderPassDesc& renderPass,
                                         const std::shared_ptr<IFramebuffer>& framebuffer,
                                         Result* outResult) {
  auto& ctx = getContext();
  framebuffer_ = std::static_pointer_cast<Framebuffer>(framebuffer);

  if (!renderPass.debugName.empty()) {
    ctx.pushDebugGroup(renderPass.debugName.c_str());
    hasDebugGroup_ = true;
  }

  auto result = framebuffer_->bind(renderPass);
  if (!result.isOk()) {
    if (hasDebugGroup_) {
      ctx.popDebugGroup();
      hasDebugGroup_ = false;
    }
    Result::setResult(outResult, std::move(result));
    return;
  }
  encoding_ = true;

  bindViewport(framebuffer_->getViewport(renderPass));
  ctx.disable(GL_SCISSOR_TEST);

  GLbitfield clearMask = 0;
  if (!renderPass.colorAttachments.empty() &&
      renderPass.colorAttachments[0].loadAction == LoadAction::Clear) {
    // every attachment is cleared to the first attachment's color
    const auto& clearColor = renderPass.colorAttachments[0].clearColor;
    ctx.colorMask(GL_TRUE, GL_TRUE, GL_TRUE, GL_TRUE);
    ctx.clearColor(clearColor.r, clearColor.g, clearColor.b, clearColor.a);
    clearMask |= GL_COLOR_BUFFER_BIT;
  }
  if (clearMask != 0) {
    ctx.clear(clearMask);
  }

  Result::setOk(outResult);
}

void RenderCommandEncoder::endEncoding() {
  if (!MIPGEN_DEBUG_VERIFY(encoding_)) {
    return;
  }
  auto& ctx = getContext();
  for (uint32_t unit = 0; unit < boundSamplerUnits_; ++unit) {
    ctx.bindSampler(unit, 0);
  }
  boundSamplerUnits_ = 0;
  if (pipelineState_) {
    pipelineState_->unbind();
    pipelineState_ = nullptr;
  }
  framebuffer_->unbind();
  framebuffer_ = nullptr;
  if (hasDebugGroup_) {
    ctx.popDebugGroup();
    hasDebugGroup_ = false;
  }
  encoding_ = false;
}

void RenderCommandEncoder::bindViewport(const Viewport& viewport) {
  getContext().viewport(static_cast<GLint>(viewport.x),
                        static_cast<GLint>(viewport.y),
                        static_cast<GLsizei>(viewport.width),
                        static_cast<GLsizei>(viewport.height));
}

void RenderCommandEncoder::bindRenderPipelineState(
    const std::shared_ptr<IRenderPipelineState>& pipelineState) {
  if (!MIPGEN_DEBUG_VERIFY(pipelineState != nullptr)) {
    return;
  }
  pipelineState_ = std::static_pointer_cast<RenderPipelineState>(pipelineState);
  pipelineState_->bind();
}

void RenderCommandEncoder::bindTexture(size_t index, ITexture* texture) {
  if (!MIPGEN_DEBUG_VERIFY(index < MIPGEN_TEXTURE_SAMPLERS_MAX)) {
    return;
  }
  if (texture == nullptr) {
    getContext().activeTexture(static_cast<GLenum>(GL_TEXTURE0 + index));
    getContext().bindTexture(GL_TEXTURE_2D, 0);
    return;
  }
  static_cast<TextureBase*>(texture)->bind(index);
}

void RenderCommandEncoder::bindSamplerState(size_t index, ISamplerState* samplerState) {
  if (!MIPGEN_DEBUG_VERIFY(index < MIPGEN_TEXTURE_SAMPLERS_MAX)) {
    return;
  }
  if (samplerState == nullptr) {
    getContext().bindSampler(static_cast<GLuint>(index), 0);
    return;
  }
  static_cast<SamplerState*>(samplerState)->bind(index);
  boundSamplerUnits_ = std::max(boundSamplerUnits_, static_cast<uint32_t>(index + 1));
}

void RenderCommandEncoder::bindBindGroup(const BindGroup& bindGroup) {
  const BindGroupDesc& desc = bindGroup.getDesc();
  for (size_t unit = 0; unit < MIPGEN_TEXTURE_SAMPLERS_MAX; ++unit) {
    if (desc.textures[unit]) {
      bindTexture(unit, desc.textures[unit].get());
    }
    if (desc.samplers[unit]) {
      bindSamplerState(unit, desc.samplers[unit].get());
    }
  }
}

void RenderCommandEncoder::draw(size_t vertexCount) {
  if (!MIPGEN_DEBUG_VERIFY(pipelineState_ != nullptr)) {
    MIPGEN_LOG_ERROR("draw() called without a render pipeline state\n");
    return;
  }
  commandBuffer_->incrementCurrentDrawCount();
  getContext().drawArrays(GL_TRIANGLES, 0, static_cast<GLsizei>(vertexCount));
}

} // namespace mipgen::opengl
