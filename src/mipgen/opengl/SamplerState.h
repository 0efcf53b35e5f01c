/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/SamplerState.h>
#include <mipgen/opengl/GLIncludes.h>
#include <mipgen/opengl/WithContext.h>

namespace mipgen::opengl {

/**
 * @brief Sampler state backed by a GL sampler object, so the same texture can be sampled with
 * different settings without touching its texture parameters.
 */
class SamplerState final : public WithContext, public ISamplerState {
 public:
  SamplerState(IContext& context, const SamplerStateDesc& desc);
  ~SamplerState() override;

  Result create();

  void bind(size_t unit);
  void unbind(size_t unit);

  [[nodiscard]] GLuint getId() const {
    return samplerID_;
  }

  // utility functions for converting from sampler state enums to GL enums
  static GLint convertMinMipFilter(SamplerMinMagFilter minFilter, SamplerMipFilter mipFilter);
  static GLint convertMagFilter(SamplerMinMagFilter magFilter);
  static GLint convertAddressMode(SamplerAddressMode addressMode);

 private:
  const SamplerStateDesc desc_;
  GLuint samplerID_ = 0;
};

} // namespace mipgen::opengl
