/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <algorithm>
#include <mipgen/Common.h>
#include <mipgen/TextureFormat.h>

namespace mipgen {

/**
 * @brief TextureType denotes the storage layout of the texture.
 *
 *  Invalid - Undefined
 *  TwoD    - Single layer, two dimensional: (Width, Height)
 */
enum class TextureType : uint8_t {
  Invalid,
  TwoD,
};

/**
 * @brief Descriptor for a region of a texture
 *
 *  x            - offset position in width
 *  y            - offset position in height
 *  width        - width of the range
 *  height       - height of the range
 *  mipLevel     - mipmap level offset of the range
 *  numMipLevels - number of mipmap levels in the range
 */
struct TextureRangeDesc {
  uint32_t x = 0;
  uint32_t y = 0;
  uint32_t width = 1;
  uint32_t height = 1;
  uint32_t mipLevel = 0;
  uint32_t numMipLevels = 1;

  // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
  static TextureRangeDesc new2D(uint32_t x,
                                uint32_t y,
                                uint32_t width,
                                uint32_t height,
                                uint32_t mipLevel = 0,
                                uint32_t numMipLevels = 1);

  /**
   * @brief Returns a new TextureRangeDesc based on this one but reduced to the specified mipLevel.
   *
   * @param newMipLevel The mip level of the returned range.
   * @remark The returned range only has 1 mip level.
   */
  [[nodiscard]] TextureRangeDesc atMipLevel(uint32_t newMipLevel) const noexcept;

  /**
   * Validates the range.
   *
   * A range is valid if:
   *  1) width, height and numMipLevels are all at least 1.
   *  2) numMipLevels is less than or equal to the max mip levels for the width and height.
   *  3) x + width and y + height do not overflow uint32_t.
   */
  [[nodiscard]] Result validate() const noexcept;

  bool operator==(const TextureRangeDesc& rhs) const noexcept;
  bool operator!=(const TextureRangeDesc& rhs) const noexcept;
};

/**
 * @brief Encapsulates properties of a texture format
 *
 *  name               - Stringified enum for the format
 *  format             - Enum for the format
 *  componentsPerPixel - Number of components for each pixel (e.g., RGB has 3)
 *  bytesPerBlock      - Bytes per pixel
 *  flags              - Additional boolean flags for the format:
 *                        - Depth:   Depth texture format
 *                        - Stencil: Stencil texture format
 *                        - sRGB:    sRGB texture format
 *                        - Integer: Integer formats cannot be sampled through float samplers
 *                        - Float:   Floating point storage
 */
struct TextureFormatProperties {
  static TextureFormatProperties fromTextureFormat(TextureFormat format);

  enum Flags : uint8_t {
    Depth = 1 << 0,
    Stencil = 1 << 1,
    sRGB = 1 << 2,
    Integer = 1 << 3,
    Float = 1 << 4,
  };

  const char* MIPGEN_NONNULL name = "Invalid";
  const TextureFormat format = TextureFormat::Invalid;
  const uint8_t componentsPerPixel = 1;
  const uint8_t bytesPerBlock = 1;
  const uint8_t flags = 0;

  [[nodiscard]] bool isValid() const noexcept {
    return format != TextureFormat::Invalid;
  }
  [[nodiscard]] bool isInteger() const noexcept {
    return (flags & Flags::Integer) != 0;
  }
  [[nodiscard]] bool isSRGB() const noexcept {
    return (flags & Flags::sRGB) != 0;
  }
  [[nodiscard]] bool isFloat() const noexcept {
    return (flags & Flags::Float) != 0;
  }
  [[nodiscard]] bool hasDepth() const noexcept {
    return (flags & Flags::Depth) != 0;
  }
  [[nodiscard]] bool hasStencil() const noexcept {
    return (flags & Flags::Stencil) != 0;
  }
  [[nodiscard]] bool hasColor() const noexcept {
    return !hasDepth() && !hasStencil();
  }
  [[nodiscard]] bool isDepthOrStencil() const noexcept {
    return hasDepth() || hasStencil();
  }

  /**
   * @brief Returns the size in bytes of a tightly packed row of `texWidth` pixels.
   */
  [[nodiscard]] uint32_t getBytesPerRow(uint32_t texWidth) const noexcept;
  [[nodiscard]] uint32_t getBytesPerRow(TextureRangeDesc range) const noexcept;

  /**
   * @brief Returns the size in bytes of a single level of the given range.
   *
   * @param bytesPerRow The size in bytes of each texture row. 0 for the format's default.
   */
  [[nodiscard]] size_t getBytesPerLayer(TextureRangeDesc range,
                                        uint32_t bytesPerRow = 0) const noexcept;

  /**
   * @brief Returns the size in bytes of all levels of the given range. Dimensions are halved for
   * each subsequent mip level.
   */
  [[nodiscard]] size_t getBytesPerRange(TextureRangeDesc range,
                                        uint32_t bytesPerRow = 0) const noexcept;
};

/**
 * @brief Descriptor for texture creation
 *
 *  width        - width of the texture
 *  height       - height of the texture
 *  usage        - Bitwise flag containing a mask of TextureUsageBits
 *  numMipLevels - Number of mip levels allocated for the texture
 *  type         - Texture type
 *  format       - Internal texture format type
 */
struct TextureDesc {
  /**
   * @brief Bitwise flags for texture usage
   *
   *  Sampled    - Can be used as read-only texture in shaders
   *  Attachment - Can be bound as a render target
   *  CopyDst    - Can receive data uploaded from CPU memory
   */
  enum TextureUsageBits : uint8_t {
    Sampled = 1 << 0,
    Attachment = 1 << 1,
    CopyDst = 1 << 2,
  };

  using TextureUsage = uint8_t;

  uint32_t width = 1;
  uint32_t height = 1;
  TextureUsage usage = 0;
  uint32_t numMipLevels = 1;
  TextureType type = TextureType::Invalid;
  TextureFormat format = TextureFormat::Invalid;

  std::string debugName;

  bool operator==(const TextureDesc& rhs) const;
  bool operator!=(const TextureDesc& rhs) const;

  /**
   * @brief Utility to create a new 2D texture
   *
   * @param format The format of the texture
   * @param width  The width of the texture
   * @param height The height of the texture
   * @param usage A combination of TextureUsage flags
   * @param debugName An optional debug name
   * @return TextureDesc
   */
  static TextureDesc new2D(TextureFormat format,
                           uint32_t width,
                           uint32_t height,
                           TextureUsage usage,
                           const char* MIPGEN_NULLABLE debugName = nullptr) {
    return TextureDesc{
        width, height, usage, 1, TextureType::TwoD, format, debugName ? debugName : ""};
  }

  /**
   * @brief Creates a TextureRangeDesc covering every level of the descriptor.
   */
  [[nodiscard]] TextureRangeDesc asRange() const noexcept;

  /**
   * @brief Utility to calculate the length of a full mip chain: floor(1 + log2(max(dims))).
   *
   * @return 0 when any dimension is 0
   */
  static uint32_t calcNumMipLevels(uint32_t width, uint32_t height);
};

/**
 * @brief Descriptor for a view onto a subset of another texture's mip levels.
 *
 *  mipLevel     - first level visible through the view
 *  numMipLevels - number of levels visible through the view
 *  format       - Invalid means the base texture's format
 */
struct TextureViewDesc {
  uint32_t mipLevel = 0;
  uint32_t numMipLevels = 1;
  TextureFormat format = TextureFormat::Invalid;
  std::string debugName;
};

/**
 * @brief Interface class for all textures.
 */
class ITexture {
 public:
  explicit ITexture(TextureFormat format) :
    properties_(TextureFormatProperties::fromTextureFormat(format)) {}
  virtual ~ITexture() = default;

  /**
   * @brief Indicates if this texture accepts CPU uploads.
   */
  [[nodiscard]] virtual bool supportsUpload() const {
    return (getUsage() & TextureDesc::TextureUsageBits::CopyDst) != 0 &&
           !properties_.isDepthOrStencil();
  }

  /**
   * @brief Uploads the given data into texture memory.
   *
   * @param range        The region to write. May cover several mip levels when bytesPerRow is 0.
   * @param data         The pointer to the data. May be a nullptr to force initialization without
   * providing data.
   * @param bytesPerRow  Number of bytes per row. If 0, it will be autocalculated assuming no
   * padding.
   * @param flipVertical Rows are written bottom-up when true.
   * @return Result      A flag for the result of operation
   */
  Result upload(const TextureRangeDesc& range,
                const void* MIPGEN_NULLABLE data,
                size_t bytesPerRow = 0,
                bool flipVertical = false) const;

  [[nodiscard]] virtual Dimensions getDimensions() const = 0;
  [[nodiscard]] const TextureFormatProperties& getProperties() const {
    return properties_;
  }
  [[nodiscard]] virtual TextureType getType() const = 0;
  [[nodiscard]] virtual TextureDesc::TextureUsage getUsage() const = 0;
  [[nodiscard]] virtual uint32_t getNumMipLevels() const = 0;

  /**
   * @brief First level of the underlying allocation this texture exposes. Non-zero for views.
   */
  [[nodiscard]] virtual uint32_t getBaseMipLevel() const {
    return 0;
  }

  /**
   * @brief Attempts to calculate how much memory the texture uses across all mip levels.
   */
  [[nodiscard]] size_t getEstimatedSizeInBytes() const;

  /**
   * @brief Validates the range against texture dimensions at the range's mip level.
   */
  [[nodiscard]] Result validateRange(const TextureRangeDesc& range) const noexcept;

  /**
   * @brief Returns a TextureRangeDesc for the texture's full extent at the specified mip level.
   */
  [[nodiscard]] TextureRangeDesc getFullRange(size_t mipLevel = 0,
                                              size_t numMipLevels = 1) const noexcept;

  [[nodiscard]] TextureFormat getFormat() const {
    return properties_.format;
  }

  /**
   * @brief Copies rows from originalData to repackedData, optionally reversing row order.
   *
   * Repacking only works correctly for 1 mip level when either bytes-per-row is non-zero.
   *
   * @param originalDataBytesPerRow Bytes per row of original data. 0 means tightly packed.
   * @param repackedBytesPerRow Bytes per row of repacked data. 0 means tightly packed.
   * @param flipVertical If true, rows are written in reverse order for each level.
   */
  static void repackData(const TextureFormatProperties& properties,
                         const TextureRangeDesc& range,
                         const uint8_t* MIPGEN_NONNULL originalData,
                         size_t originalDataBytesPerRow,
                         uint8_t* MIPGEN_NONNULL repackedData,
                         size_t repackedBytesPerRow,
                         bool flipVertical = false);

 protected:
  [[nodiscard]] virtual bool needsRepacking([[maybe_unused]] const TextureRangeDesc& range,
                                            [[maybe_unused]] size_t bytesPerRow) const {
    return false;
  }

  [[nodiscard]] virtual Result uploadInternal([[maybe_unused]] const TextureRangeDesc& range,
                                              [[maybe_unused]] const void* MIPGEN_NULLABLE data,
                                              [[maybe_unused]] size_t bytesPerRow = 0) const {
    MIPGEN_DEBUG_ASSERT_NOT_IMPLEMENTED();
    return Result{Result::Code::Unimplemented, "Upload not implemented."};
  }

  const TextureFormatProperties properties_;
};

} // namespace mipgen

namespace std {

template<>
struct hash<mipgen::TextureFormat> {
  size_t operator()(const mipgen::TextureFormat& key) const;
};

} // namespace std
