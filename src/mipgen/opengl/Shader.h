/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/Shader.h>
#include <mipgen/opengl/GLIncludes.h>
#include <mipgen/opengl/WithContext.h>

namespace mipgen::opengl {

class ShaderStages final : public IShaderStages, public WithContext {
 public:
  ShaderStages(const ShaderStagesDesc& desc, IContext& context);
  ~ShaderStages() override;

  // link the given shaders into a program
  Result create(const ShaderStagesDesc& desc);

  void bind();
  void unbind();

  [[nodiscard]] GLuint getProgramID() const {
    return programID_;
  }

 private:
  void createRenderProgram(Result* MIPGEN_NULLABLE result);
  [[nodiscard]] std::string getProgramInfoLog(GLuint programID) const;

  GLuint programID_ = 0;
};

class ShaderModule final : public WithContext, public IShaderModule {
 public:
  ShaderModule(IContext& context, ShaderModuleInfo info);
  ~ShaderModule() override;

  // compile the shader from the source in desc
  Result create(const ShaderModuleDesc& desc);

  [[nodiscard]] GLuint getShaderID() const {
    return shaderID_;
  }

 private:
  GLenum shaderType_ = 0;
  GLuint shaderID_ = 0;
};

} // namespace mipgen::opengl
