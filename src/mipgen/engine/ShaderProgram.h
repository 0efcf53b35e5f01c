/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <mipgen/Device.h>

namespace mipgen::engine {

/// The downsampling shaders linked for one output format, plus the pipeline rendering them into
/// a color target of that format.
class ShaderProgram final {
 public:
  static std::unique_ptr<ShaderProgram> create(IDevice& device,
                                               TextureFormat format,
                                               const std::string& labelPrefix,
                                               Result* MIPGEN_NULLABLE outResult);

  [[nodiscard]] TextureFormat format() const noexcept {
    return format_;
  }
  [[nodiscard]] const std::shared_ptr<IShaderStages>& shaderStages() const noexcept {
    return shaderStages_;
  }
  [[nodiscard]] const std::shared_ptr<IRenderPipelineState>& pipeline() const noexcept {
    return pipeline_;
  }

  /// Texture unit the source level must be bound to.
  [[nodiscard]] size_t sourceUnit() const noexcept {
    return sourceUnit_;
  }

 private:
  ShaderProgram(TextureFormat format,
                std::shared_ptr<IShaderStages> shaderStages,
                std::shared_ptr<IRenderPipelineState> pipeline,
                size_t sourceUnit);

  const TextureFormat format_;
  std::shared_ptr<IShaderStages> shaderStages_;
  std::shared_ptr<IRenderPipelineState> pipeline_;
  size_t sourceUnit_ = 0;
};

} // namespace mipgen::engine
