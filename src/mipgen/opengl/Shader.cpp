/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/opengl/Shader.h>

#include <mipgen/opengl/IContext.h>
#include <string>
#include <vector>

namespace mipgen::opengl {

ShaderStages::ShaderStages(const ShaderStagesDesc& desc, IContext& context) :
  IShaderStages(desc), WithContext(context) {}

ShaderStages::~ShaderStages() {
  if (programID_ != 0) {
    getContext().deleteProgram(programID_);
    programID_ = 0;
  }
}

void ShaderStages::createRenderProgram(Result* result) {
  if (!MIPGEN_DEBUG_VERIFY(getVertexModule())) {
    Result::setResult(
        result, Result::Code::ArgumentInvalid, "Missing required vertex shader stage");
    return;
  }

  if (!MIPGEN_DEBUG_VERIFY(getFragmentModule())) {
    Result::setResult(
        result, Result::Code::ArgumentInvalid, "Missing required fragment shader stage");
    return;
  }

  const auto& vertexShader = static_cast<ShaderModule&>(*getVertexModule());
  const auto& fragmentShader = static_cast<ShaderModule&>(*getFragmentModule());
  const GLuint vertexShaderID = vertexShader.getShaderID();
  const GLuint fragmentShaderID = fragmentShader.getShaderID();

  if (vertexShaderID == 0 || fragmentShaderID == 0) {
    Result::setResult(result, Result::Code::ArgumentInvalid, "Missing required shader stages");
    return;
  }

  // the program ID is only replaced once linking succeeds
  const GLuint programID = getContext().createProgram();
  if (programID == 0) {
    Result::setResult(result, Result::Code::RuntimeError, "Failed to create GL program");
    return;
  }

  getContext().attachShader(programID, vertexShaderID);
  getContext().attachShader(programID, fragmentShaderID);
  getContext().linkProgram(programID);

  getContext().detachShader(programID, vertexShaderID);
  getContext().detachShader(programID, fragmentShaderID);

  GLint status = GL_FALSE;
  getContext().getProgramiv(programID, GL_LINK_STATUS, &status);
  if (status == GL_FALSE) {
    const std::string errorLog = getProgramInfoLog(programID);
    MIPGEN_LOG_ERROR("failed to link shaders:\n%s\n", errorLog.c_str());

    getContext().deleteProgram(programID);
    Result::setResult(result, Result::Code::RuntimeError, errorLog);
    return;
  }

  if (programID_ != 0) {
    getContext().deleteProgram(programID_);
  }
  programID_ = programID;
  getContext().objectLabel(GL_PROGRAM_KHR, programID_, getDebugName());

  Result::setOk(result);
}

std::string ShaderStages::getProgramInfoLog(GLuint programID) const {
  GLsizei logSize = 0;
  getContext().getProgramiv(programID, GL_INFO_LOG_LENGTH, &logSize);
  if (logSize <= 0) {
    return {};
  }

  std::vector<GLchar> log(logSize);
  getContext().getProgramInfoLog(programID, logSize, nullptr, log.data());
  return std::string(log.data());
}

Result ShaderStages::create(const ShaderStagesDesc& /*desc*/) {
  Result result;
  createRenderProgram(&result);
  return result;
}

void ShaderStages::bind() {
  getContext().useProgram(programID_);
}

void ShaderStages::unbind() {
  getContext().useProgram(0);
}

ShaderModule::ShaderModule(IContext& context, ShaderModuleInfo info) :
  WithContext(context), IShaderModule(std::move(info)) {}

ShaderModule::~ShaderModule() {
  if (shaderID_ != 0) {
    getContext().deleteShader(shaderID_);
    shaderID_ = 0;
  }
}

Result ShaderModule::create(const ShaderModuleDesc& desc) {
  if (!desc.isValid()) {
    return Result(Result::Code::ArgumentNull, "Null shader source");
  }

  switch (desc.info.stage) {
  case ShaderStage::Vertex:
    shaderType_ = GL_VERTEX_SHADER;
    break;
  case ShaderStage::Fragment:
    shaderType_ = GL_FRAGMENT_SHADER;
    break;
  }

  // the shader ID is only replaced once compilation succeeds
  const GLuint shaderID = getContext().createShader(shaderType_);
  if (shaderID == 0) {
    return Result(Result::Code::RuntimeError, "Failed to create shader ID");
  }

  const GLchar* src = desc.source;
  getContext().shaderSource(shaderID, 1, &src, nullptr);
  getContext().compileShader(shaderID);

  GLint status = GL_FALSE;
  getContext().getShaderiv(shaderID, GL_COMPILE_STATUS, &status);
  if (status == GL_FALSE) {
    GLsizei logSize = 0;
    getContext().getShaderiv(shaderID, GL_INFO_LOG_LENGTH, &logSize);

    std::string errorLog;
    if (logSize > 0) {
      std::vector<GLchar> log(logSize);
      getContext().getShaderInfoLog(shaderID, logSize, nullptr, log.data());
      errorLog = log.data();
    }
    MIPGEN_LOG_ERROR("failed to compile %s shader %s:\n%s\n",
                     desc.info.stage == ShaderStage::Vertex ? "vertex" : "fragment",
                     desc.debugName.c_str(),
                     errorLog.c_str());

    getContext().deleteShader(shaderID);
    return Result(Result::Code::ArgumentInvalid, errorLog);
  }

  if (shaderID_ != 0) {
    getContext().deleteShader(shaderID_);
  }
  shaderID_ = shaderID;
  getContext().objectLabel(GL_SHADER_KHR, shaderID_, desc.debugName);

  return Result();
}

} // namespace mipgen::opengl
