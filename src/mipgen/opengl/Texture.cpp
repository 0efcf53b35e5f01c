/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/opengl/Texture.h>

#include <algorithm>
#include <mipgen/opengl/IContext.h>

namespace mipgen::opengl {

///--------------------------------------
/// MARK: - Texture

Texture::Texture(IContext& context, TextureFormat format) :
  WithContext(context), TextureBase(format) {}

Texture::~Texture() {
  if (textureID_ != 0) {
    getContext().deleteTextures(1, &textureID_);
    textureID_ = 0;
  }
}

bool Texture::toFormatDescGL(TextureFormat textureFormat, FormatDescGL& outFormatGL) {
  // Table 3.2 and 3.13 of the OpenGL ES 3.0.6 specification
  switch (textureFormat) {
  case TextureFormat::A_UNorm8:
    outFormatGL = {GL_ALPHA, GL_ALPHA, GL_UNSIGNED_BYTE, false};
    return true;
  case TextureFormat::L_UNorm8:
    outFormatGL = {GL_LUMINANCE, GL_LUMINANCE, GL_UNSIGNED_BYTE, false};
    return true;
  case TextureFormat::LA_UNorm8:
    outFormatGL = {GL_LUMINANCE_ALPHA, GL_LUMINANCE_ALPHA, GL_UNSIGNED_BYTE, false};
    return true;
  case TextureFormat::R_UNorm8:
    outFormatGL = {GL_R8, GL_RED, GL_UNSIGNED_BYTE};
    return true;
  case TextureFormat::RG_UNorm8:
    outFormatGL = {GL_RG8, GL_RG, GL_UNSIGNED_BYTE};
    return true;
  case TextureFormat::RGBA_UNorm8:
    outFormatGL = {GL_RGBA8, GL_RGBA, GL_UNSIGNED_BYTE};
    return true;
  case TextureFormat::BGRA_UNorm8:
    outFormatGL = {GL_BGRA8_EXT, GL_BGRA_EXT, GL_UNSIGNED_BYTE};
    return true;
  case TextureFormat::RGBA_SRGB:
    outFormatGL = {GL_SRGB8_ALPHA8, GL_RGBA, GL_UNSIGNED_BYTE};
    return true;
  case TextureFormat::RGB10_A2_UNorm_Rev:
    outFormatGL = {GL_RGB10_A2, GL_RGBA, GL_UNSIGNED_INT_2_10_10_10_REV};
    return true;
  case TextureFormat::R_F16:
    outFormatGL = {GL_R16F, GL_RED, GL_HALF_FLOAT};
    return true;
  case TextureFormat::RG_F16:
    outFormatGL = {GL_RG16F, GL_RG, GL_HALF_FLOAT};
    return true;
  case TextureFormat::RGBA_F16:
    outFormatGL = {GL_RGBA16F, GL_RGBA, GL_HALF_FLOAT};
    return true;
  case TextureFormat::R_F32:
    outFormatGL = {GL_R32F, GL_RED, GL_FLOAT};
    return true;
  case TextureFormat::RG_F32:
    outFormatGL = {GL_RG32F, GL_RG, GL_FLOAT};
    return true;
  case TextureFormat::RGBA_F32:
    outFormatGL = {GL_RGBA32F, GL_RGBA, GL_FLOAT};
    return true;
  case TextureFormat::R_UInt16:
    outFormatGL = {GL_R16UI, GL_RED_INTEGER, GL_UNSIGNED_SHORT};
    return true;
  case TextureFormat::RG_UInt16:
    outFormatGL = {GL_RG16UI, GL_RG_INTEGER, GL_UNSIGNED_SHORT};
    return true;
  case TextureFormat::RGBA_UInt32:
    outFormatGL = {GL_RGBA32UI, GL_RGBA_INTEGER, GL_UNSIGNED_INT};
    return true;
  case TextureFormat::Z_UNorm16:
    outFormatGL = {GL_DEPTH_COMPONENT16, GL_DEPTH_COMPONENT, GL_UNSIGNED_SHORT};
    return true;
  case TextureFormat::Z_UNorm24:
    outFormatGL = {GL_DEPTH_COMPONENT24, GL_DEPTH_COMPONENT, GL_UNSIGNED_INT};
    return true;
  case TextureFormat::S8_UInt_Z24_UNorm:
    outFormatGL = {GL_DEPTH24_STENCIL8, GL_DEPTH_STENCIL, GL_UNSIGNED_INT_24_8};
    return true;
  case TextureFormat::Invalid:
  case TextureFormat::BGRA_SRGB:
  case TextureFormat::S_UInt8:
    return false;
  }
  MIPGEN_UNREACHABLE_RETURN(false)
}

Result Texture::create(const TextureDesc& desc) {
  if (desc.type != TextureType::TwoD) {
    return Result(Result::Code::Unsupported, "Only 2D textures are supported");
  }
  if (!toFormatDescGL(desc.format, formatDescGL_)) {
    return Result(Result::Code::UnsupportedFormat,
                  "Texture format not supported: " + std::string(getProperties().name));
  }
  const auto maxLevels = TextureDesc::calcNumMipLevels(desc.width, desc.height);
  if (desc.numMipLevels > maxLevels) {
    return Result(Result::Code::ArgumentOutOfRange, "numMipLevels exceeds the full mip chain");
  }

  width_ = desc.width;
  height_ = desc.height;
  numMipLevels_ = desc.numMipLevels;
  usage_ = desc.usage;

  auto& ctx = getContext();
  ctx.genTextures(1, &textureID_);
  if (textureID_ == 0) {
    return Result(Result::Code::RuntimeError, "Failed to create GL texture");
  }
  ctx.bindTexture(GL_TEXTURE_2D, textureID_);
  if (formatDescGL_.immutable) {
    ctx.texStorage2D(GL_TEXTURE_2D,
                     static_cast<GLsizei>(numMipLevels_),
                     static_cast<GLenum>(formatDescGL_.internalFormat),
                     static_cast<GLsizei>(width_),
                     static_cast<GLsizei>(height_));
  } else {
    ctx.pixelStorei(GL_UNPACK_ALIGNMENT, 1);
    for (uint32_t level = 0; level < numMipLevels_; ++level) {
      const auto levelSize = getDimensions().atLevel(level);
      ctx.texImage2D(GL_TEXTURE_2D,
                     static_cast<GLint>(level),
                     formatDescGL_.internalFormat,
                     static_cast<GLsizei>(levelSize.width),
                     static_cast<GLsizei>(levelSize.height),
                     0, // border
                     formatDescGL_.format,
                     formatDescGL_.type,
                     nullptr);
    }
    ctx.pixelStorei(GL_UNPACK_ALIGNMENT, 4);
  }
  ctx.texParameteri(GL_TEXTURE_2D, GL_TEXTURE_BASE_LEVEL, 0);
  ctx.texParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAX_LEVEL, static_cast<GLint>(numMipLevels_ - 1));
  boundBaseLevel_ = 0;
  boundNumLevels_ = numMipLevels_;
  ctx.objectLabel(GL_TEXTURE_KHR, textureID_, desc.debugName);
  ctx.bindTexture(GL_TEXTURE_2D, 0);

  return ctx.checkForErrors("Texture::create");
}

Dimensions Texture::getDimensions() const {
  return Dimensions{width_, height_};
}

TextureType Texture::getType() const {
  return TextureType::TwoD;
}

TextureDesc::TextureUsage Texture::getUsage() const {
  return usage_;
}

uint32_t Texture::getNumMipLevels() const {
  return numMipLevels_;
}

Texture& Texture::getStorage() const {
  return const_cast<Texture&>(*this);
}

void Texture::bind(size_t unit) const {
  bindLevels(unit, 0, numMipLevels_);
}

void Texture::bindLevels(size_t unit, uint32_t baseLevel, uint32_t numLevels) const {
  MIPGEN_DEBUG_ASSERT(numLevels > 0 && baseLevel + numLevels <= numMipLevels_);
  auto& ctx = getContext();
  ctx.activeTexture(static_cast<GLenum>(GL_TEXTURE0 + unit));
  ctx.bindTexture(GL_TEXTURE_2D, textureID_);
  if (baseLevel != boundBaseLevel_ || numLevels != boundNumLevels_) {
    ctx.texParameteri(GL_TEXTURE_2D, GL_TEXTURE_BASE_LEVEL, static_cast<GLint>(baseLevel));
    ctx.texParameteri(
        GL_TEXTURE_2D, GL_TEXTURE_MAX_LEVEL, static_cast<GLint>(baseLevel + numLevels - 1));
    boundBaseLevel_ = baseLevel;
    boundNumLevels_ = numLevels;
  }
}

void Texture::attachAsColor(GLenum framebufferTarget, uint32_t index, uint32_t mipLevel) const {
  MIPGEN_DEBUG_ASSERT(mipLevel < numMipLevels_);
  getContext().framebufferTexture2D(framebufferTarget,
                                    static_cast<GLenum>(GL_COLOR_ATTACHMENT0 + index),
                                    GL_TEXTURE_2D,
                                    textureID_,
                                    static_cast<GLint>(mipLevel));
}

GLint Texture::getAlignment(size_t stride, uint32_t mipLevel) const {
  MIPGEN_DEBUG_ASSERT(mipLevel < numMipLevels_);

  const auto pixelBytesPerRow =
      getProperties().getBytesPerRow(getDimensions().atLevel(mipLevel).width);

  if (stride == 0 || !MIPGEN_DEBUG_VERIFY(pixelBytesPerRow <= stride)) {
    return 1;
  } else if (stride % 8 == 0) {
    return 8;
  } else if (stride % 4 == 0) {
    return 4;
  } else if (stride % 2 == 0) {
    return 2;
  } else {
    return 1;
  }
}

bool Texture::needsRepacking(const TextureRangeDesc& range, size_t bytesPerRow) const {
  if (bytesPerRow == 0) {
    return false;
  }
  // GL_UNPACK_ROW_LENGTH can only describe strides that are a whole number of pixels
  return bytesPerRow % getProperties().bytesPerBlock != 0 ||
         bytesPerRow < getProperties().getBytesPerRow(range);
}

Result Texture::uploadInternal(const TextureRangeDesc& range,
                               const void* MIPGEN_NULLABLE data,
                               size_t bytesPerRow) const {
  if (data == nullptr) {
    return Result{};
  }
  auto& ctx = getContext();
  ctx.bindTexture(GL_TEXTURE_2D, textureID_);

  const auto* bytes = static_cast<const uint8_t*>(data);
  for (uint32_t mipLevel = range.mipLevel; mipLevel < range.mipLevel + range.numMipLevels;
       ++mipLevel) {
    const auto mipRange = range.atMipLevel(mipLevel);
    const size_t tightBytesPerRow = getProperties().getBytesPerRow(mipRange);
    const size_t stride = bytesPerRow == 0 ? tightBytesPerRow : bytesPerRow;

    ctx.pixelStorei(GL_UNPACK_ALIGNMENT, getAlignment(stride, mipLevel));
    ctx.pixelStorei(GL_UNPACK_ROW_LENGTH,
                    bytesPerRow == 0
                        ? 0
                        : static_cast<GLint>(bytesPerRow / getProperties().bytesPerBlock));

    ctx.texSubImage2D(GL_TEXTURE_2D,
                      static_cast<GLint>(mipLevel),
                      static_cast<GLint>(mipRange.x),
                      static_cast<GLint>(mipRange.y),
                      static_cast<GLsizei>(mipRange.width),
                      static_cast<GLsizei>(mipRange.height),
                      formatDescGL_.format,
                      formatDescGL_.type,
                      bytes);
    bytes += stride * mipRange.height;
  }

  // Restore defaults
  ctx.pixelStorei(GL_UNPACK_ROW_LENGTH, 0);
  ctx.pixelStorei(GL_UNPACK_ALIGNMENT, 4);
  ctx.bindTexture(GL_TEXTURE_2D, 0);

  return ctx.checkForErrors("Texture::upload");
}

///--------------------------------------
/// MARK: - TextureView

TextureView::TextureView(std::shared_ptr<Texture> parent, const TextureViewDesc& desc) :
  TextureBase(parent->getFormat()),
  parent_(std::move(parent)),
  mipLevel_(desc.mipLevel),
  numMipLevels_(desc.numMipLevels) {}

Dimensions TextureView::getDimensions() const {
  return parent_->getDimensions().atLevel(mipLevel_);
}

TextureType TextureView::getType() const {
  return parent_->getType();
}

TextureDesc::TextureUsage TextureView::getUsage() const {
  // views are read-only
  return parent_->getUsage() & ~TextureDesc::TextureUsageBits::CopyDst;
}

uint32_t TextureView::getNumMipLevels() const {
  return numMipLevels_;
}

uint32_t TextureView::getBaseMipLevel() const {
  return mipLevel_;
}

void TextureView::bind(size_t unit) const {
  parent_->bindLevels(unit, mipLevel_, numMipLevels_);
}

} // namespace mipgen::opengl
