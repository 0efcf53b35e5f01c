/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/Common.h>

namespace mipgen {

/**
 * @brief Filtering option to use when sampling textures within the same mipmap level.
 *
 * Nearest : The sampled value is the value from the texel closest to the sampling point.
 * Linear  : The sampled value is linearly interpolated from the texel values nearest to the
 *           sampling point.
 */
enum class SamplerMinMagFilter : uint8_t { Nearest = 0, Linear };

/**
 * @brief Filtering option to use when sampling textures between mipmap levels.
 *
 * Disabled: The sampled value is the selected from the base level of the bound view.
 * Nearest : The sampled value is the selected from the nearest mipmap level to the filter.
 * Linear  : The sampled value is linearly interpolated between the nearest mipmap levels.
 */
enum class SamplerMipFilter : uint8_t { Disabled = 0, Nearest, Linear };

/**
 * @brief Filtering option to use when sampling outside the boundary of a texture
 *
 * Repeat       : The texture repeats outside the range [0, 1].
 * Clamp        : Sampling locations are clamped to [0, 1].
 * MirrorRepeat : The texture repeats outside the range [0, 1], mirrored every other time.
 */
enum class SamplerAddressMode : uint8_t { Repeat = 0, Clamp, MirrorRepeat };

/**
 * @brief Describes the texture sampling configuration for a texture.
 */
struct SamplerStateDesc {
  SamplerMinMagFilter minFilter = SamplerMinMagFilter::Nearest;
  SamplerMinMagFilter magFilter = SamplerMinMagFilter::Nearest;
  SamplerMipFilter mipFilter = SamplerMipFilter::Disabled;
  SamplerAddressMode addressModeU = SamplerAddressMode::Repeat;
  SamplerAddressMode addressModeV = SamplerAddressMode::Repeat;
  /**
   * @brief The minimum mipmap level to use when sampling a texture. The valid range is [0, 15]
   */
  uint8_t mipLodMin = 0;
  /**
   * @brief The maximum mipmap level to use when sampling a texture. The valid range is
   * [mipLodMin, 15]
   */
  uint8_t mipLodMax = 15;

  std::string debugName;

  /**
   * @brief Creates a new SamplerStateDesc set up for linearly interpolating within the base level.
   *
   * minFilter and magFilter set to SamplerMinMagFilter::Linear.
   * mipFilter is set to SamplerMipFilter::Disabled.
   */
  static SamplerStateDesc newLinear() {
    SamplerStateDesc desc;
    desc.minFilter = desc.magFilter = SamplerMinMagFilter::Linear;
    desc.mipFilter = SamplerMipFilter::Disabled;
    desc.debugName = "newLinear()";
    return desc;
  }

  bool operator==(const SamplerStateDesc& rhs) const;
  bool operator!=(const SamplerStateDesc& rhs) const;
};

/**
 * @brief A texture sampling configuration.
 *
 * To create an instance, populate a SamplerStateDesc and call IDevice::createSamplerState.
 * Bind it through a bind group or IRenderCommandEncoder::bindSamplerState.
 */
class ISamplerState {
 protected:
  ISamplerState() = default;

 public:
  virtual ~ISamplerState() = default;
};

} // namespace mipgen
