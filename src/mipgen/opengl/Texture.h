/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/Texture.h>
#include <mipgen/opengl/GLIncludes.h>
#include <mipgen/opengl/WithContext.h>

namespace mipgen::opengl {

/**
 * @brief GL enums describing how a TextureFormat is allocated and transferred.
 *
 * `immutable` formats are allocated with glTexStorage2D; the others (unsized luminance/alpha
 * formats) are allocated level by level with glTexImage2D.
 */
struct FormatDescGL {
  GLint internalFormat = 0;
  GLenum format = 0;
  GLenum type = 0;
  bool immutable = true;
};

class Texture;

/**
 * @brief Common base of textures and texture views: both resolve to a GL texture object plus the
 * range of its levels they expose.
 */
class TextureBase : public ITexture {
 public:
  using ITexture::ITexture;

  /** @brief The texture owning the GL texture object. */
  [[nodiscard]] virtual Texture& getStorage() const = 0;

  /**
   * @brief Binds the exposed levels to texture unit `unit`.
   */
  virtual void bind(size_t unit) const = 0;
};

class Texture final : public WithContext, public TextureBase {
 public:
  Texture(IContext& context, TextureFormat format);
  ~Texture() override;

  Result create(const TextureDesc& desc);

  // ITexture overrides
  [[nodiscard]] Dimensions getDimensions() const override;
  [[nodiscard]] TextureType getType() const override;
  [[nodiscard]] TextureDesc::TextureUsage getUsage() const override;
  [[nodiscard]] uint32_t getNumMipLevels() const override;

  [[nodiscard]] GLuint getId() const {
    return textureID_;
  }
  [[nodiscard]] const FormatDescGL& getFormatDescGL() const {
    return formatDescGL_;
  }

  [[nodiscard]] Texture& getStorage() const override;
  void bind(size_t unit) const override;

  /**
   * @brief Binds the texture to texture unit `unit`, restricting sampling to the levels
   * [baseLevel, baseLevel + numLevels).
   */
  void bindLevels(size_t unit, uint32_t baseLevel, uint32_t numLevels) const;

  /**
   * @brief Attaches `mipLevel` to GL_COLOR_ATTACHMENT0 + index of the bound framebuffer.
   */
  void attachAsColor(GLenum framebufferTarget, uint32_t index, uint32_t mipLevel) const;

  /**
   * @brief Unpack/pack alignment for rows of `stride` bytes at `mipLevel`.
   */
  [[nodiscard]] GLint getAlignment(size_t stride, uint32_t mipLevel) const;

  static bool toFormatDescGL(TextureFormat textureFormat, FormatDescGL& outFormatGL);

 protected:
  [[nodiscard]] bool needsRepacking(const TextureRangeDesc& range,
                                    size_t bytesPerRow) const override;
  [[nodiscard]] Result uploadInternal(const TextureRangeDesc& range,
                                      const void* MIPGEN_NULLABLE data,
                                      size_t bytesPerRow) const override;

 private:
  GLuint textureID_ = 0;
  FormatDescGL formatDescGL_;
  uint32_t width_ = 0;
  uint32_t height_ = 0;
  uint32_t numMipLevels_ = 1;
  TextureDesc::TextureUsage usage_ = 0;
  // Level range currently exposed through GL_TEXTURE_BASE_LEVEL/GL_TEXTURE_MAX_LEVEL
  mutable uint32_t boundBaseLevel_ = 0;
  mutable uint32_t boundNumLevels_ = 0;
};

/**
 * @brief A range of mip levels of another texture. Keeps the parent alive.
 */
class TextureView final : public TextureBase {
 public:
  TextureView(std::shared_ptr<Texture> parent, const TextureViewDesc& desc);

  [[nodiscard]] Dimensions getDimensions() const override;
  [[nodiscard]] TextureType getType() const override;
  [[nodiscard]] TextureDesc::TextureUsage getUsage() const override;
  [[nodiscard]] uint32_t getNumMipLevels() const override;
  [[nodiscard]] uint32_t getBaseMipLevel() const override;

  [[nodiscard]] Texture& getStorage() const override {
    return *parent_;
  }
  [[nodiscard]] const std::shared_ptr<Texture>& getParent() const {
    return parent_;
  }

  void bind(size_t unit) const override;

 private:
  std::shared_ptr<Texture> parent_;
  uint32_t mipLevel_ = 0;
  uint32_t numMipLevels_ = 1;
};

} // namespace mipgen::opengl
