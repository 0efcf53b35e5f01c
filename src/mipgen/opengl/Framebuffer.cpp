/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/opengl/Framebuffer.h>

#include <algorithm>
#include <mipgen/opengl/IContext.h>
#include <string>

namespace mipgen::opengl {

Result checkFramebufferStatus(IContext& context, GLenum framebufferTarget) {
  auto code = Result::Code::Ok;
  std::string message;
  // check that we've created a proper frame buffer
  const GLenum status = context.checkFramebufferStatus(framebufferTarget);
  if (status != GL_FRAMEBUFFER_COMPLETE) {
    code = Result::Code::RuntimeError;

    switch (status) {
    case GL_FRAMEBUFFER_INCOMPLETE_ATTACHMENT:
      message = "GL_FRAMEBUFFER_INCOMPLETE_ATTACHMENT";
      break;
    case GL_FRAMEBUFFER_INCOMPLETE_MISSING_ATTACHMENT:
      message = "GL_FRAMEBUFFER_INCOMPLETE_MISSING_ATTACHMENT";
      break;
    case GL_FRAMEBUFFER_INCOMPLETE_DIMENSIONS:
      message = "GL_FRAMEBUFFER_INCOMPLETE_DIMENSIONS";
      break;
    case GL_FRAMEBUFFER_UNSUPPORTED:
      message = "GL_FRAMEBUFFER_UNSUPPORTED";
      break;
    default:
      message = "GL_FRAMEBUFFER unknown error: " + std::to_string(status);
      break;
    }
  }

  return Result(code, message);
}

///--------------------------------------
/// MARK: - FramebufferBindingGuard

FramebufferBindingGuard::FramebufferBindingGuard(IContext& context) : context_(context) {
  context_.getIntegerv(GL_READ_FRAMEBUFFER_BINDING, &currentReadFramebuffer_);
  context_.getIntegerv(GL_DRAW_FRAMEBUFFER_BINDING, &currentDrawFramebuffer_);
}

FramebufferBindingGuard::~FramebufferBindingGuard() {
  context_.bindFramebuffer(GL_READ_FRAMEBUFFER, static_cast<GLuint>(currentReadFramebuffer_));
  context_.bindFramebuffer(GL_DRAW_FRAMEBUFFER, static_cast<GLuint>(currentDrawFramebuffer_));
}

///--------------------------------------
/// MARK: - Framebuffer

Framebuffer::Framebuffer(IContext& context) : WithContext(context) {}

void Framebuffer::unbind() const {
  getContext().bindFramebuffer(GL_FRAMEBUFFER, 0);
}

void Framebuffer::copyBytesColorAttachment(ICommandQueue& /* unused */,
                                           size_t index,
                                           void* pixelBytes,
                                           const TextureRangeDesc& range,
                                           size_t bytesPerRow) const {
  // Only support attachment 0 because that's what glReadPixels supports
  if (index != 0) {
    MIPGEN_DEBUG_ABORT("Invalid index: %zu", index);
    return;
  }
  MIPGEN_DEBUG_ASSERT(range.numMipLevels == 1, "range.numMipLevels MUST be 1");

  const FramebufferBindingGuard guard(getContext());
  readPixels(range, pixelBytes, bytesPerRow);
}

///--------------------------------------
/// MARK: - CustomFramebuffer

CustomFramebuffer::~CustomFramebuffer() {
  if (frameBufferID_ != 0) {
    getContext().deleteFramebuffers(1, &frameBufferID_);
    frameBufferID_ = 0;
  }
}

Result CustomFramebuffer::initialize(const FramebufferDesc& desc) {
  renderTarget_ = desc;

  bool hasAttachment = false;
  Dimensions size{};
  for (size_t i = 0; i < MIPGEN_COLOR_ATTACHMENTS_MAX; ++i) {
    const auto& texture = desc.colorAttachments[i].texture;
    if (!texture) {
      continue;
    }
    if ((texture->getUsage() & TextureDesc::TextureUsageBits::Attachment) == 0) {
      return Result(Result::Code::ArgumentInvalid,
                    "Color attachment " + std::to_string(i) + " lacks Attachment usage");
    }
    const auto dims = texture->getDimensions();
    if (hasAttachment && (dims.width != size.width || dims.height != size.height)) {
      return Result(Result::Code::ArgumentInvalid, "Color attachments differ in size");
    }
    size = dims;
    hasAttachment = true;
  }
  if (!hasAttachment) {
    return Result(Result::Code::ArgumentInvalid, "Framebuffer has no color attachments");
  }

  getContext().genFramebuffers(1, &frameBufferID_);
  if (frameBufferID_ == 0) {
    return Result(Result::Code::RuntimeError, "Failed to create GL framebuffer");
  }

  const FramebufferBindingGuard guard(getContext());
  getContext().bindFramebuffer(GL_FRAMEBUFFER, frameBufferID_);
  getContext().objectLabel(GL_FRAMEBUFFER_KHR, frameBufferID_, desc.debugName);

  std::vector<GLenum> drawBuffers;
  for (size_t i = 0; i < MIPGEN_COLOR_ATTACHMENTS_MAX; ++i) {
    const auto& texture = desc.colorAttachments[i].texture;
    drawBuffers.push_back(texture ? static_cast<GLenum>(GL_COLOR_ATTACHMENT0 + i) : GL_NONE);
  }
  // trailing GL_NONE entries are not needed
  while (!drawBuffers.empty() && drawBuffers.back() == GL_NONE) {
    drawBuffers.pop_back();
  }
  getContext().drawBuffers(static_cast<GLsizei>(drawBuffers.size()), drawBuffers.data());

  attachAll(GL_FRAMEBUFFER, RenderPassDesc{});
  const auto status = checkFramebufferStatus(getContext(), GL_FRAMEBUFFER);
  if (!status.isOk()) {
    MIPGEN_LOG_ERROR("Framebuffer %s is incomplete: %s\n",
                     desc.debugName.c_str(),
                     status.message.c_str());
  }
  return status;
}

uint8_t CustomFramebuffer::passMipLevel(const RenderPassDesc& renderPass, size_t index) const {
  return index < renderPass.colorAttachments.size() ? renderPass.colorAttachments[index].mipLevel
                                                    : 0;
}

void CustomFramebuffer::attachAll(GLenum framebufferTarget,
                                  const RenderPassDesc& renderPass) const {
  for (size_t i = 0; i < MIPGEN_COLOR_ATTACHMENTS_MAX; ++i) {
    const auto& texture = renderTarget_.colorAttachments[i].texture;
    if (!texture) {
      continue;
    }
    const auto& glTexture = static_cast<const TextureBase&>(*texture);
    const uint32_t level = glTexture.getBaseMipLevel() + passMipLevel(renderPass, i);
    glTexture.getStorage().attachAsColor(framebufferTarget, static_cast<uint32_t>(i), level);
    attachedLevels_[i] = level;
  }
}

std::vector<size_t> CustomFramebuffer::getColorAttachmentIndices() const {
  std::vector<size_t> indices;
  for (size_t i = 0; i < MIPGEN_COLOR_ATTACHMENTS_MAX; ++i) {
    if (renderTarget_.colorAttachments[i].texture) {
      indices.push_back(i);
    }
  }
  return indices;
}

std::shared_ptr<ITexture> CustomFramebuffer::getColorAttachment(size_t index) const {
  MIPGEN_DEBUG_ASSERT(index < MIPGEN_COLOR_ATTACHMENTS_MAX);
  return renderTarget_.colorAttachments[index].texture;
}

Viewport CustomFramebuffer::getViewport(const RenderPassDesc& renderPass) const {
  for (size_t i = 0; i < MIPGEN_COLOR_ATTACHMENTS_MAX; ++i) {
    const auto& texture = renderTarget_.colorAttachments[i].texture;
    if (texture) {
      const auto dims = texture->getDimensions().atLevel(passMipLevel(renderPass, i));
      return Viewport{
          0.0f, 0.0f, static_cast<float>(dims.width), static_cast<float>(dims.height)};
    }
  }
  return Viewport{};
}

Result CustomFramebuffer::bind(const RenderPassDesc& renderPass) const {
  const size_t numPassAttachments =
      std::min(renderPass.colorAttachments.size(), size_t(MIPGEN_COLOR_ATTACHMENTS_MAX));
  for (size_t i = 0; i < numPassAttachments; ++i) {
    const auto& texture = renderTarget_.colorAttachments[i].texture;
    if (texture && renderPass.colorAttachments[i].mipLevel >= texture->getNumMipLevels()) {
      return Result(Result::Code::ArgumentOutOfRange,
                    "Render pass mip level " +
                        std::to_string(renderPass.colorAttachments[i].mipLevel) +
                        " is outside the attachment");
    }
  }

  getContext().bindFramebuffer(GL_FRAMEBUFFER, frameBufferID_);
  bool levelChanged = false;
  for (size_t i = 0; i < MIPGEN_COLOR_ATTACHMENTS_MAX; ++i) {
    const auto& texture = renderTarget_.colorAttachments[i].texture;
    if (texture && attachedLevels_[i] != texture->getBaseMipLevel() + passMipLevel(renderPass, i)) {
      levelChanged = true;
    }
  }
  if (levelChanged) {
    attachAll(GL_FRAMEBUFFER, renderPass);
    auto status = checkFramebufferStatus(getContext(), GL_FRAMEBUFFER);
    if (!status.isOk()) {
      return status;
    }
  }
  return Result();
}

void CustomFramebuffer::readPixels(const TextureRangeDesc& range,
                                   void* pixelBytes,
                                   size_t bytesPerRow) const {
  const auto& attachment = renderTarget_.colorAttachments[0].texture;
  if (attachment == nullptr) {
    MIPGEN_DEBUG_ABORT("The framebuffer does not have any color attachment at index 0");
    return;
  }
  const auto& glTexture = static_cast<const TextureBase&>(*attachment);
  auto& storage = glTexture.getStorage();

  getContext().bindFramebuffer(GL_READ_FRAMEBUFFER, frameBufferID_);
  const uint32_t level = glTexture.getBaseMipLevel() + range.mipLevel;
  storage.attachAsColor(GL_READ_FRAMEBUFFER, 0, level);
  attachedLevels_[0] = level;
  const auto status = checkFramebufferStatus(getContext(), GL_READ_FRAMEBUFFER);
  if (!status.isOk()) {
    MIPGEN_LOG_ERROR("Cannot read back framebuffer: %s\n", status.message.c_str());
    return;
  }

  // The bytesPerRow value is used to decide both the alignment and the row length. Row length is
  // only used when bytesPerRow is a multiple of the block size.
  const auto& properties = attachment->getProperties();
  const bool usePackRowLength = bytesPerRow != 0 && bytesPerRow % properties.bytesPerBlock == 0;
  if (usePackRowLength) {
    getContext().pixelStorei(GL_PACK_ROW_LENGTH,
                             static_cast<GLint>(bytesPerRow / properties.bytesPerBlock));
    getContext().pixelStorei(GL_PACK_ALIGNMENT, 1);
  } else {
    const size_t finalBytesPerRow =
        bytesPerRow == 0 ? properties.getBytesPerRow(range) : bytesPerRow;
    getContext().pixelStorei(GL_PACK_ROW_LENGTH, 0);
    getContext().pixelStorei(GL_PACK_ALIGNMENT, storage.getAlignment(finalBytesPerRow, level));
  }

  getContext().flush();
  const auto& formatGL = storage.getFormatDescGL();
  getContext().readPixels(static_cast<GLint>(range.x),
                          static_cast<GLint>(range.y),
                          static_cast<GLsizei>(range.width),
                          static_cast<GLsizei>(range.height),
                          formatGL.format,
                          formatGL.type,
                          pixelBytes);
  getContext().pixelStorei(GL_PACK_ROW_LENGTH, 0);
  getContext().pixelStorei(GL_PACK_ALIGNMENT, 4);
  const auto result = getContext().checkForErrors("CustomFramebuffer::readPixels");
  if (!result.isOk()) {
    MIPGEN_LOG_ERROR("Cannot read back framebuffer: %s\n", result.message.c_str());
  }
}

///--------------------------------------
/// MARK: - CurrentFramebuffer

std::vector<size_t> CurrentFramebuffer::getColorAttachmentIndices() const {
  return {};
}

std::shared_ptr<ITexture> CurrentFramebuffer::getColorAttachment(size_t /*index*/) const {
  return nullptr;
}

Viewport CurrentFramebuffer::getViewport(const RenderPassDesc& /*renderPass*/) const {
  return Viewport{0.0f, 0.0f, static_cast<float>(width_), static_cast<float>(height_)};
}

Result CurrentFramebuffer::bind(const RenderPassDesc& renderPass) const {
  for (const auto& attachment : renderPass.colorAttachments) {
    if (attachment.mipLevel != 0) {
      return Result(Result::Code::ArgumentOutOfRange, "The window framebuffer has one level");
    }
  }
  getContext().bindFramebuffer(GL_FRAMEBUFFER, 0);
  return Result();
}

void CurrentFramebuffer::readPixels(const TextureRangeDesc& range,
                                    void* pixelBytes,
                                    size_t bytesPerRow) const {
  getContext().bindFramebuffer(GL_READ_FRAMEBUFFER, 0);
  getContext().pixelStorei(GL_PACK_ROW_LENGTH,
                           bytesPerRow == 0 ? 0 : static_cast<GLint>(bytesPerRow / 4));
  getContext().pixelStorei(GL_PACK_ALIGNMENT, 4);
  // GL_RGBA with GL_UNSIGNED_BYTE is the only combination glReadPixels always supports
  getContext().readPixels(static_cast<GLint>(range.x),
                          static_cast<GLint>(range.y),
                          static_cast<GLsizei>(range.width),
                          static_cast<GLsizei>(range.height),
                          GL_RGBA,
                          GL_UNSIGNED_BYTE,
                          pixelBytes);
  getContext().pixelStorei(GL_PACK_ROW_LENGTH, 0);
  const auto result = getContext().checkForErrors("CurrentFramebuffer::readPixels");
  if (!result.isOk()) {
    MIPGEN_LOG_ERROR("Cannot read back the window framebuffer: %s\n", result.message.c_str());
  }
}

} // namespace mipgen::opengl
