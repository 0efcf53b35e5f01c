/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/Common.h>
#include <mipgen/TextureFormat.h>

namespace mipgen {

/**
 * @brief Optional device features. Per-format render and filter support is reported by
 * ICapabilities::getTextureFormatCapabilities() instead.
 *
 * PremultipliedAlphaSurface Window surfaces can be presented with premultiplied alpha
 */
enum class DeviceFeatures {
  PremultipliedAlphaSurface = 0,
};

/**
 * @brief DeviceFeatureLimits provides specific limitations on certain features supported on the
 * device
 *
 * MaxTextureDimension1D2D      Maximum texture dimensions
 * MaxTextureSamplers           Maximum number of fragment texture units
 */
enum class DeviceFeatureLimits {
  MaxTextureDimension1D2D = 0,
  MaxTextureSamplers,
};

/**
 * @brief ICapabilities defines the capabilities interface. Currently, it is IDevice
 * which implements this interface.
 */
class ICapabilities {
 public:
  /**
   * @brief TextureFormatCapabilityBits provides specific texture format usage
   *
   * Unsupported       The format is not supported
   * Sampled           Can be used as read-only texture in vertex/fragment shaders
   * SampledFiltered   The texture can be filtered during sampling
   * Attachment        The texture can be used as a render target
   * All               All capabilities are supported
   */
  enum TextureFormatCapabilityBits : uint8_t {
    Unsupported = 0,
    Sampled = 1 << 0,
    SampledFiltered = 1 << 1,
    Attachment = 1 << 2,
    All = Sampled | SampledFiltered | Attachment
  };

  using TextureFormatCapabilities = uint8_t;

  /**
   * @brief This function indicates if a device feature is supported at all.
   */
  [[nodiscard]] virtual bool hasFeature(DeviceFeatures feature) const = 0;

  /**
   * @brief This function gets capabilities of a specified texture format
   */
  [[nodiscard]] virtual TextureFormatCapabilities getTextureFormatCapabilities(
      TextureFormat format) const = 0;

  /**
   * @brief This function gets device feature limits.
   *
   * @param featureLimits The device feature limits
   * @param result        Receives the limit
   *
   * @return True,        If the limit is known
   *         False,       Otherwise
   */
  virtual bool getFeatureLimits(DeviceFeatureLimits featureLimits, size_t& result) const = 0;

 protected:
  virtual ~ICapabilities() = default;
};

inline bool contains(ICapabilities::TextureFormatCapabilities value,
                     ICapabilities::TextureFormatCapabilityBits flag) {
  return (value & flag) == flag;
}

} // namespace mipgen
