/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/opengl/RenderPipelineState.h>

#include <algorithm>
#include <mipgen/opengl/IContext.h>
#include <mipgen/opengl/Shader.h>
#include <vector>

namespace mipgen::opengl {

namespace {

bool isSamplerType(GLenum type) {
  switch (type) {
  case GL_SAMPLER_2D:
  case GL_SAMPLER_3D:
  case GL_SAMPLER_CUBE:
  case GL_SAMPLER_2D_SHADOW:
  case GL_SAMPLER_2D_ARRAY:
  case GL_SAMPLER_2D_ARRAY_SHADOW:
  case GL_SAMPLER_CUBE_SHADOW:
  case GL_INT_SAMPLER_2D:
  case GL_INT_SAMPLER_3D:
  case GL_INT_SAMPLER_CUBE:
  case GL_INT_SAMPLER_2D_ARRAY:
  case GL_UNSIGNED_INT_SAMPLER_2D:
  case GL_UNSIGNED_INT_SAMPLER_3D:
  case GL_UNSIGNED_INT_SAMPLER_CUBE:
  case GL_UNSIGNED_INT_SAMPLER_2D_ARRAY:
    return true;
  default:
    return false;
  }
}

} // namespace

RenderPipelineState::RenderPipelineState(IContext& context,
                                         const RenderPipelineDesc& desc,
                                         Result* outResult) :
  WithContext(context), IRenderPipelineState(desc) {
  unitSamplerLocationMap_.fill(-1);
  Result::setResult(outResult, create());
}

void RenderPipelineState::reflectSamplers(GLuint programID) {
  GLint count = 0;
  getContext().getProgramiv(programID, GL_ACTIVE_UNIFORMS, &count);

  GLint maxLength = 0;
  getContext().getProgramiv(programID, GL_ACTIVE_UNIFORM_MAX_LENGTH, &maxLength);
  std::vector<GLchar> name(std::max(maxLength, 1));

  for (GLint i = 0; i < count; ++i) {
    GLsizei length = 0;
    GLint size = 0;
    GLenum type = GL_NONE;
    getContext().getActiveUniform(programID,
                                  static_cast<GLuint>(i),
                                  static_cast<GLsizei>(name.size()),
                                  &length,
                                  &size,
                                  &type,
                                  name.data());
    if (!isSamplerType(type)) {
      continue;
    }
    const std::string uniformName(name.data(), length);
    samplerUniforms_.emplace_back(uniformName,
                                  getContext().getUniformLocation(programID, uniformName.c_str()));
  }
}

Result RenderPipelineState::create() {
  if (!desc_.shaderStages) {
    return Result(Result::Code::ArgumentInvalid, "Missing shader stages");
  }
  if (!desc_.shaderStages->isValid()) {
    return Result(Result::Code::ArgumentInvalid, "Shader stages need a vertex and fragment module");
  }
  if (desc_.targetDesc.colorAttachments.size() > MIPGEN_COLOR_ATTACHMENTS_MAX) {
    return Result(Result::Code::ArgumentOutOfRange, "Too many color attachments");
  }

  const auto& shaderStages = static_cast<ShaderStages&>(*desc_.shaderStages);
  const GLuint programID = shaderStages.getProgramID();
  if (programID == 0) {
    return Result(Result::Code::InvalidOperation, "Shader stages are not linked");
  }

  reflectSamplers(programID);

  if (desc_.fragmentUnitSamplerMap.empty()) {
    // consecutive units in reflection order
    if (samplerUniforms_.size() > MIPGEN_TEXTURE_SAMPLERS_MAX) {
      return Result{Result::Code::RuntimeError, "Too many samplers"};
    }
    for (size_t unit = 0; unit < samplerUniforms_.size(); ++unit) {
      unitSamplerLocationMap_[unit] = samplerUniforms_[unit].second;
      samplerUnits_[samplerUniforms_[unit].first] = unit;
    }
  } else {
    // Note this work is only done once. Beyond this point, there is no more query by name
    for (const auto& [textureUnit, samplerName] : desc_.fragmentUnitSamplerMap) {
      if (textureUnit >= MIPGEN_TEXTURE_SAMPLERS_MAX) {
        return Result{Result::Code::ArgumentOutOfRange, "Unit specified greater than maximum"};
      }
      GLint loc = -1;
      for (const auto& [uniformName, location] : samplerUniforms_) {
        if (uniformName == samplerName) {
          loc = location;
          break;
        }
      }
      if (loc >= 0) {
        unitSamplerLocationMap_[textureUnit] = loc;
        samplerUnits_[samplerName] = textureUnit;
      } else {
        MIPGEN_LOG_ERROR("Sampler uniform (%s) not found in shader.\n", samplerName.c_str());
      }
    }
  }

  if (!desc_.targetDesc.colorAttachments.empty()) {
    const ColorWriteMask colorWriteMask = desc_.targetDesc.colorAttachments[0].colorWriteMask;
    colorMask_[0] = static_cast<GLboolean>((colorWriteMask & ColorWriteBitsRed) != 0);
    colorMask_[1] = static_cast<GLboolean>((colorWriteMask & ColorWriteBitsGreen) != 0);
    colorMask_[2] = static_cast<GLboolean>((colorWriteMask & ColorWriteBitsBlue) != 0);
    colorMask_[3] = static_cast<GLboolean>((colorWriteMask & ColorWriteBitsAlpha) != 0);
  }

  return getContext().checkForErrors("RenderPipelineState::create");
}

void RenderPipelineState::bind() {
  auto& shaderStages = static_cast<ShaderStages&>(*desc_.shaderStages);
  shaderStages.bind();
  for (size_t unit = 0; unit < unitSamplerLocationMap_.size(); ++unit) {
    if (unitSamplerLocationMap_[unit] >= 0) {
      getContext().uniform1i(unitSamplerLocationMap_[unit], static_cast<GLint>(unit));
    }
  }

  getContext().colorMask(colorMask_[0], colorMask_[1], colorMask_[2], colorMask_[3]);
  getContext().disable(GL_BLEND);
  getContext().disable(GL_DEPTH_TEST);
  // mip passes draw a screen-aligned quad; never cull it
  getContext().disable(GL_CULL_FACE);
}

void RenderPipelineState::unbind() {
  static_cast<ShaderStages&>(*desc_.shaderStages).unbind();
}

bool RenderPipelineState::hasTextureUnit(size_t unit) const {
  return unit < unitSamplerLocationMap_.size() && unitSamplerLocationMap_[unit] >= 0;
}

int RenderPipelineState::getIndexByName(const std::string& name, ShaderStage stage) const {
  if (stage != ShaderStage::Fragment) {
    return -1;
  }
  const auto it = samplerUnits_.find(name);
  return it == samplerUnits_.end() ? -1 : static_cast<int>(it->second);
}

} // namespace mipgen::opengl
