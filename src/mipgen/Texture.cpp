/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/Texture.h>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <limits>
#include <utility>

size_t std::hash<mipgen::TextureFormat>::operator()(mipgen::TextureFormat const& key) const {
  return std::hash<size_t>()(static_cast<size_t>(key));
}

namespace mipgen {

TextureRangeDesc TextureRangeDesc::new2D(uint32_t x,
                                         uint32_t y,
                                         uint32_t width,
                                         uint32_t height,
                                         uint32_t mipLevel,
                                         uint32_t numMipLevels) {
  TextureRangeDesc desc;
  desc.x = x;
  desc.y = y;
  desc.width = width;
  desc.height = height;
  desc.mipLevel = mipLevel;
  desc.numMipLevels = numMipLevels;
  return desc;
}

TextureRangeDesc TextureRangeDesc::atMipLevel(uint32_t newMipLevel) const noexcept {
  TextureRangeDesc newRange = *this;
  newRange.numMipLevels = 1;
  newRange.mipLevel = newMipLevel;
  if (newMipLevel <= mipLevel) {
    return newRange;
  }

  const auto delta = newMipLevel - mipLevel;
  newRange.x = x >> delta;
  newRange.y = y >> delta;
  newRange.width = std::max(width >> delta, 1u);
  newRange.height = std::max(height >> delta, 1u);

  return newRange;
}


Result TextureRangeDesc::validate() const noexcept {
  if (width == 0 || height == 0 || numMipLevels == 0) {
    return Result{Result::Code::ArgumentInvalid,
                  "width, height and numMipLevels must be at least 1."};
  }

  const uint32_t maxMipLevels = TextureDesc::calcNumMipLevels(width, height);
  if (numMipLevels > maxMipLevels) {
    return Result{Result::Code::ArgumentInvalid,
                  "`numMipLevels` must not exceed max mip levels for width and height."};
  }

  constexpr uint32_t kMax = std::numeric_limits<uint32_t>::max();
  if (static_cast<size_t>(x) + width > kMax || static_cast<size_t>(y) + height > kMax) {
    return Result{Result::Code::ArgumentInvalid,
                  "x + width and y + height must not exceed std::numeric_limits<uint32_t>::max()."};
  }

  return Result{};
}

bool TextureRangeDesc::operator==(const TextureRangeDesc& rhs) const noexcept {
  return x == rhs.x && y == rhs.y && width == rhs.width && height == rhs.height &&
         mipLevel == rhs.mipLevel && numMipLevels == rhs.numMipLevels;
}

bool TextureRangeDesc::operator!=(const TextureRangeDesc& rhs) const noexcept {
  return !operator==(rhs);
}

namespace {
using Flags = TextureFormatProperties::Flags;

struct FormatRow {
  TextureFormat format;
  const char* name;
  uint8_t componentsPerPixel;
  uint8_t bytesPerBlock;
  uint8_t flags;
};

constexpr FormatRow kFormatRows[] = {
    {TextureFormat::Invalid, "Invalid", 1, 1, 0},
    {TextureFormat::A_UNorm8, "A_UNorm8", 1, 1, 0},
    {TextureFormat::L_UNorm8, "L_UNorm8", 1, 1, 0},
    {TextureFormat::R_UNorm8, "R_UNorm8", 1, 1, 0},
    {TextureFormat::R_F16, "R_F16", 1, 2, Flags::Float},
    {TextureFormat::R_UInt16, "R_UInt16", 1, 2, Flags::Integer},
    {TextureFormat::LA_UNorm8, "LA_UNorm8", 2, 2, 0},
    {TextureFormat::RG_UNorm8, "RG_UNorm8", 2, 2, 0},
    {TextureFormat::RGBA_UNorm8, "RGBA_UNorm8", 4, 4, 0},
    {TextureFormat::BGRA_UNorm8, "BGRA_UNorm8", 4, 4, 0},
    {TextureFormat::RGBA_SRGB, "RGBA_SRGB", 4, 4, Flags::sRGB},
    {TextureFormat::BGRA_SRGB, "BGRA_SRGB", 4, 4, Flags::sRGB},
    {TextureFormat::RG_F16, "RG_F16", 2, 4, Flags::Float},
    {TextureFormat::RG_UInt16, "RG_UInt16", 2, 4, Flags::Integer},
    {TextureFormat::RGB10_A2_UNorm_Rev, "RGB10_A2_UNorm_Rev", 4, 4, 0},
    {TextureFormat::R_F32, "R_F32", 1, 4, Flags::Float},
    {TextureFormat::RGBA_F16, "RGBA_F16", 4, 8, Flags::Float},
    {TextureFormat::RG_F32, "RG_F32", 2, 8, Flags::Float},
    {TextureFormat::RGBA_UInt32, "RGBA_UInt32", 4, 16, Flags::Integer},
    {TextureFormat::RGBA_F32, "RGBA_F32", 4, 16, Flags::Float},
    {TextureFormat::Z_UNorm16, "Z_UNorm16", 1, 2, Flags::Depth},
    {TextureFormat::Z_UNorm24, "Z_UNorm24", 1, 3, Flags::Depth},
    {TextureFormat::S8_UInt_Z24_UNorm, "S8_UInt_Z24_UNorm", 2, 4, Flags::Depth | Flags::Stencil},
    {TextureFormat::S_UInt8, "S_UInt8", 1, 1, Flags::Stencil | Flags::Integer},
};
} // namespace

TextureFormatProperties TextureFormatProperties::fromTextureFormat(TextureFormat format) {
  for (const auto& row : kFormatRows) {
    if (row.format == format) {
      return TextureFormatProperties{
          row.name, row.format, row.componentsPerPixel, row.bytesPerBlock, row.flags};
    }
  }
  MIPGEN_UNREACHABLE_RETURN(TextureFormatProperties{})
}

uint32_t TextureFormatProperties::getBytesPerRow(uint32_t texWidth) const noexcept {
  return getBytesPerRow(TextureRangeDesc::new2D(0, 0, texWidth, 1));
}

uint32_t TextureFormatProperties::getBytesPerRow(TextureRangeDesc range) const noexcept {
  const uint32_t texWidth = std::max(range.width, 1u);
  return texWidth * bytesPerBlock;
}

size_t TextureFormatProperties::getBytesPerLayer(TextureRangeDesc range,
                                                 uint32_t bytesPerRow) const noexcept {
  const uint32_t texWidth = std::max(range.width, 1u);
  const uint32_t texHeight = std::max(range.height, 1u);
  const uint32_t widthBytes = std::max(bytesPerRow, texWidth * bytesPerBlock);
  return static_cast<size_t>(widthBytes) * texHeight;
}

size_t TextureFormatProperties::getBytesPerRange(TextureRangeDesc range,
                                                 uint32_t bytesPerRow) const noexcept {
  MIPGEN_DEBUG_ASSERT(bytesPerRow == 0 || bytesPerRow == getBytesPerRow(range) ||
                      range.numMipLevels == 1);

  size_t bytes = 0;
  for (uint32_t i = 0; i < range.numMipLevels; ++i) {
    bytes += getBytesPerLayer(range.atMipLevel(range.mipLevel + i), bytesPerRow);
  }

  return bytes;
}

TextureRangeDesc TextureDesc::asRange() const noexcept {
  mipgen::TextureRangeDesc range;
  range.width = width;
  range.height = height;
  range.numMipLevels = numMipLevels;

  return range;
}

uint32_t TextureDesc::calcNumMipLevels(uint32_t width, uint32_t height) {
  if (width == 0 || height == 0) {
    return 0;
  }
  uint32_t levels = 1;
  for (uint32_t size = std::max(width, height); size > 1; size >>= 1) {
    ++levels;
  }
  return levels;
}

bool TextureDesc::operator==(const TextureDesc& rhs) const {
  return (type == rhs.type) && (format == rhs.format) && (width == rhs.width) &&
         (height == rhs.height) && (usage == rhs.usage) && (numMipLevels == rhs.numMipLevels) &&
         (debugName == rhs.debugName);
}

bool TextureDesc::operator!=(const TextureDesc& rhs) const {
  return !operator==(rhs);
}

size_t ITexture::getEstimatedSizeInBytes() const {
  return properties_.getBytesPerRange(getFullRange(0, getNumMipLevels()));
}

Result ITexture::validateRange(const TextureRangeDesc& range) const noexcept {
  const auto result = range.validate();
  if (!result.isOk()) {
    return result;
  }

  const auto levelSize = getDimensions().atLevel(range.mipLevel);
  const size_t texMipLevels = getNumMipLevels();
  const size_t levelWidth = levelSize.width;
  const size_t levelHeight = levelSize.height;

  if (range.width > levelWidth || range.height > levelHeight ||
      range.numMipLevels > texMipLevels) {
    return Result{Result::Code::ArgumentOutOfRange, "range dimensions exceed texture dimensions"};
  }
  if (range.x > levelWidth - range.width || range.y > levelHeight - range.height ||
      range.mipLevel > texMipLevels - range.numMipLevels) {
    return Result{Result::Code::ArgumentOutOfRange, "range dimensions exceed texture dimensions"};
  }

  return Result{};
}

TextureRangeDesc ITexture::getFullRange(size_t mipLevel, size_t numMipLevels) const noexcept {
  const auto levelSize = getDimensions().atLevel(static_cast<uint32_t>(mipLevel));
  return TextureRangeDesc::new2D(0,
                                 0,
                                 levelSize.width,
                                 levelSize.height,
                                 static_cast<uint32_t>(mipLevel),
                                 static_cast<uint32_t>(numMipLevels));
}

void ITexture::repackData(const TextureFormatProperties& properties,
                          const TextureRangeDesc& range,
                          const uint8_t* MIPGEN_NONNULL originalData,
                          size_t originalDataBytesPerRow,
                          uint8_t* MIPGEN_NONNULL repackedData,
                          size_t repackedBytesPerRow,
                          bool flipVertical) {
  if (!MIPGEN_DEBUG_VERIFY(originalData != nullptr && repackedData != nullptr)) {
    return;
  }
  if (!MIPGEN_DEBUG_VERIFY(range.numMipLevels == 1 ||
                           (originalDataBytesPerRow == 0 && repackedBytesPerRow == 0))) {
    return;
  }
  const auto fullRangeBytesPerRow = properties.getBytesPerRow(range);
  if (originalDataBytesPerRow > 0 &&
      !MIPGEN_DEBUG_VERIFY(originalDataBytesPerRow >= fullRangeBytesPerRow)) {
    return;
  }
  if (repackedBytesPerRow > 0 &&
      !MIPGEN_DEBUG_VERIFY(repackedBytesPerRow >= fullRangeBytesPerRow)) {
    return;
  }

  for (uint32_t mipLevel = range.mipLevel; mipLevel < range.mipLevel + range.numMipLevels;
       ++mipLevel) {
    const auto mipRange = range.atMipLevel(mipLevel);
    const size_t rangeBytesPerRow = properties.getBytesPerRow(mipRange);
    const size_t originalDataIncrement = originalDataBytesPerRow == 0 ? rangeBytesPerRow
                                                                      : originalDataBytesPerRow;
    const size_t repackedDataIncrement = repackedBytesPerRow == 0 ? rangeBytesPerRow
                                                                  : repackedBytesPerRow;
    uint8_t* repackedDataPtr = repackedData;
    const std::ptrdiff_t increment = flipVertical
                                         ? -static_cast<std::ptrdiff_t>(repackedDataIncrement)
                                         : static_cast<std::ptrdiff_t>(repackedDataIncrement);
    // Start at the end
    if (flipVertical) {
      repackedDataPtr += repackedDataIncrement * (mipRange.height - 1);
    }
    for (size_t y = 0; y < mipRange.height; ++y) {
      std::memcpy(repackedDataPtr, originalData, rangeBytesPerRow);
      repackedDataPtr += increment;
      originalData += originalDataIncrement;
    }
    repackedData += repackedDataIncrement * mipRange.height;
  }
}

Result ITexture::upload(const TextureRangeDesc& range,
                        const void* MIPGEN_NULLABLE data,
                        size_t bytesPerRow,
                        bool flipVertical) const {
  if (!MIPGEN_DEBUG_VERIFY(supportsUpload())) {
    return Result{Result::Code::InvalidOperation, "Texture doesn't support upload"};
  }

  const auto result = validateRange(range);
  if (!result.isOk()) {
    return result;
  }

  if (getType() != TextureType::TwoD) {
    return Result{Result::Code::InvalidOperation, "Unknown texture type"};
  }

  const auto formatBytesPerRow = properties_.getBytesPerRow(range);
  if (bytesPerRow > 0) {
    if (bytesPerRow < formatBytesPerRow) {
      return Result(Result::Code::ArgumentInvalid, "bytesPerRow too small.");
    }
    if (range.numMipLevels > 1 && bytesPerRow != formatBytesPerRow) {
      return Result(Result::Code::ArgumentInvalid,
                    "bytesPerRow MUST be 0 when uploading multiple mip levels.");
    }
  }

  std::unique_ptr<uint8_t[]> repackedData = nullptr;

  // Repack data if necessary for upload
  if (data != nullptr && (flipVertical || needsRepacking(range, bytesPerRow))) {
    repackedData = std::make_unique<uint8_t[]>(properties_.getBytesPerRange(range));
    ITexture::repackData(properties_,
                         range,
                         static_cast<const uint8_t*>(data),
                         bytesPerRow,
                         repackedData.get(),
                         0,
                         flipVertical);
    bytesPerRow = 0;
    data = repackedData.get();
  }

  return uploadInternal(range, data, bytesPerRow);
}

} // namespace mipgen
