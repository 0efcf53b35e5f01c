/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <array>
#include <utility>
#include <vector>
#include <mipgen/RenderPipelineState.h>
#include <mipgen/opengl/GLIncludes.h>
#include <mipgen/opengl/WithContext.h>
#include <string>
#include <unordered_map>

namespace mipgen::opengl {

class RenderPipelineState final : public WithContext, public IRenderPipelineState {
 public:
  RenderPipelineState(IContext& context,
                      const RenderPipelineDesc& desc,
                      Result* MIPGEN_NULLABLE outResult);
  ~RenderPipelineState() override = default;

  [[nodiscard]] int getIndexByName(const std::string& name, ShaderStage stage) const override;

  void bind();
  void unbind();

  /**
   * @brief True when a sampler uniform of the program reads from texture unit `unit`.
   */
  [[nodiscard]] bool hasTextureUnit(size_t unit) const;

 private:
  Result create();
  // name -> location of every active sampler uniform, in reflection order
  void reflectSamplers(GLuint programID);

  std::vector<std::pair<std::string, GLint>> samplerUniforms_;
  std::unordered_map<std::string, size_t> samplerUnits_;
  std::array<GLint, MIPGEN_TEXTURE_SAMPLERS_MAX> unitSamplerLocationMap_{};
  std::array<GLboolean, 4> colorMask_ = {GL_TRUE, GL_TRUE, GL_TRUE, GL_TRUE};
};

} // namespace mipgen::opengl
