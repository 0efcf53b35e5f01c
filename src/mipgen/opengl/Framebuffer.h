/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/Framebuffer.h>
#include <mipgen/RenderPass.h>
#include <mipgen/opengl/GLIncludes.h>
#include <mipgen/opengl/Texture.h>
#include <mipgen/opengl/WithContext.h>

namespace mipgen::opengl {

Result checkFramebufferStatus(IContext& context, GLenum framebufferTarget);

///--------------------------------------
/// MARK: - FramebufferBindingGuard

class FramebufferBindingGuard {
 public:
  explicit FramebufferBindingGuard(IContext& context);
  ~FramebufferBindingGuard();

 private:
  IContext& context_;
  GLint currentReadFramebuffer_ = 0;
  GLint currentDrawFramebuffer_ = 0;
};

// Framebuffer encapsulates an immutable render target (attachments) and per-render pass state.
class Framebuffer : public WithContext, public IFramebuffer {
 public:
  explicit Framebuffer(IContext& context);

  [[nodiscard]] virtual Viewport getViewport(const RenderPassDesc& renderPass) const = 0;
  [[nodiscard]] virtual Result bind(const RenderPassDesc& renderPass) const = 0;
  virtual void unbind() const;

  void copyBytesColorAttachment(ICommandQueue& /* unused */,
                                size_t index,
                                void* MIPGEN_NONNULL pixelBytes,
                                const TextureRangeDesc& range,
                                size_t bytesPerRow = 0) const override;

  [[nodiscard]] GLuint getId() const {
    return frameBufferID_;
  }

 protected:
  virtual void readPixels(const TextureRangeDesc& range,
                          void* MIPGEN_NONNULL pixelBytes,
                          size_t bytesPerRow) const = 0;

  // NOLINTNEXTLINE(misc-non-private-member-variables-in-classes)
  GLuint frameBufferID_ = 0;
};

// CustomFramebuffer renders into caller-provided textures. The level that receives rendering is
// chosen per render pass and is relative to the attachment's base level, so a TextureView
// attachment renders into its own levels of the parent texture.
class CustomFramebuffer final : public Framebuffer {
 public:
  using Framebuffer::Framebuffer;
  ~CustomFramebuffer() override;

  Result initialize(const FramebufferDesc& desc);

  [[nodiscard]] std::vector<size_t> getColorAttachmentIndices() const override;
  [[nodiscard]] std::shared_ptr<ITexture> getColorAttachment(size_t index) const override;

  [[nodiscard]] Viewport getViewport(const RenderPassDesc& renderPass) const override;
  [[nodiscard]] Result bind(const RenderPassDesc& renderPass) const override;

 private:
  void attachAll(GLenum framebufferTarget, const RenderPassDesc& renderPass) const;
  [[nodiscard]] uint8_t passMipLevel(const RenderPassDesc& renderPass, size_t index) const;
  void readPixels(const TextureRangeDesc& range,
                  void* MIPGEN_NONNULL pixelBytes,
                  size_t bytesPerRow) const override;

  FramebufferDesc renderTarget_;
  // Absolute level of the parent texture currently attached at each index
  mutable uint32_t attachedLevels_[MIPGEN_COLOR_ATTACHMENTS_MAX] = {};
};

// CurrentFramebuffer is the window system's default framebuffer (object 0).
class CurrentFramebuffer final : public Framebuffer {
 public:
  using Framebuffer::Framebuffer;

  void setSize(uint32_t width, uint32_t height) {
    width_ = width;
    height_ = height;
  }

  [[nodiscard]] std::vector<size_t> getColorAttachmentIndices() const override;
  [[nodiscard]] std::shared_ptr<ITexture> getColorAttachment(size_t index) const override;

  [[nodiscard]] Viewport getViewport(const RenderPassDesc& renderPass) const override;
  [[nodiscard]] Result bind(const RenderPassDesc& renderPass) const override;

 private:
  void readPixels(const TextureRangeDesc& range,
                  void* MIPGEN_NONNULL pixelBytes,
                  size_t bytesPerRow) const override;

  uint32_t width_ = 1;
  uint32_t height_ = 1;
};

} // namespace mipgen::opengl
