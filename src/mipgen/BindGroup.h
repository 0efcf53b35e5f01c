/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/Common.h>
#include <mipgen/SamplerState.h>
#include <mipgen/Texture.h>

namespace mipgen {

/**
 * @brief Textures and samplers bound together. Slot `i` of `textures` is paired with slot `i` of
 * `samplers` and is bound to texture unit `i`.
 */
struct BindGroupDesc {
  std::shared_ptr<ITexture> textures[MIPGEN_TEXTURE_SAMPLERS_MAX] = {};
  std::shared_ptr<ISamplerState> samplers[MIPGEN_TEXTURE_SAMPLERS_MAX] = {};
  std::string debugName;
};

/**
 * @brief An immutable bind group created by IDevice::createBindGroup(). It keeps its textures and
 * samplers alive for as long as it is referenced.
 */
class BindGroup final {
 public:
  explicit BindGroup(BindGroupDesc desc) : desc_(std::move(desc)) {}

  [[nodiscard]] const BindGroupDesc& getDesc() const noexcept {
    return desc_;
  }

 private:
  const BindGroupDesc desc_;
};

} // namespace mipgen
