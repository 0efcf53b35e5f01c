/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/engine/ShaderProgram.h>

#include <mipgen/Format.h>
#include <mipgen/engine/MipmapShaders.h>

namespace mipgen::engine {

#define CHECK_RESULT(res, outResPtr)          \
  if (!(res).isOk()) {                        \
    Result::setResult((outResPtr), (res));    \
    return nullptr;                           \
  }

ShaderProgram::ShaderProgram(TextureFormat format,
                             std::shared_ptr<IShaderStages> shaderStages,
                             std::shared_ptr<IRenderPipelineState> pipeline,
                             size_t sourceUnit) :
  format_(format),
  shaderStages_(std::move(shaderStages)),
  pipeline_(std::move(pipeline)),
  sourceUnit_(sourceUnit) {}

std::unique_ptr<ShaderProgram> ShaderProgram::create(IDevice& device,
                                                     TextureFormat format,
                                                     const std::string& labelPrefix,
                                                     Result* outResult) {
  const auto properties = TextureFormatProperties::fromTextureFormat(format);
  Result result;

  auto vertexModule = device.createShaderModule(
      ShaderModuleDesc::fromStringInput(shaders::kMipmapVertexShader,
                                        {ShaderStage::Vertex, "main"},
                                        labelPrefix + "mipmap vertex shader"),
      &result);
  CHECK_RESULT(result, outResult);

  auto fragmentModule = device.createShaderModule(
      ShaderModuleDesc::fromStringInput(shaders::kMipmapFragmentShader,
                                        {ShaderStage::Fragment, "main"},
                                        labelPrefix + "mipmap fragment shader"),
      &result);
  CHECK_RESULT(result, outResult);

  auto stagesDesc =
      ShaderStagesDesc::fromRenderModules(std::move(vertexModule), std::move(fragmentModule));
  stagesDesc.debugName = labelPrefix + "mipmap shader stages";
  std::shared_ptr<IShaderStages> stages = device.createShaderStages(stagesDesc, &result);
  CHECK_RESULT(result, outResult);

  RenderPipelineDesc pipelineDesc;
  pipelineDesc.shaderStages = stages;
  pipelineDesc.targetDesc.colorAttachments.resize(1);
  pipelineDesc.targetDesc.colorAttachments[0].textureFormat = format;
  pipelineDesc.debugName = MIPGEN_FORMAT("{}mipmap pipeline {}", labelPrefix, properties.name);
  auto pipeline = device.createRenderPipeline(pipelineDesc, &result);
  CHECK_RESULT(result, outResult);

  // Units come from reflection since the pipeline was built without a sampler map.
  const int unit = pipeline->getIndexByName(shaders::kSourceLevelSampler, ShaderStage::Fragment);
  if (unit < 0) {
    Result::setResult(outResult,
                      Result::Code::RuntimeError,
                      MIPGEN_FORMAT("Sampler '{}' not found in the mipmap program",
                                    shaders::kSourceLevelSampler));
    return nullptr;
  }

  Result::setOk(outResult);
  return std::unique_ptr<ShaderProgram>(new ShaderProgram(
      format, std::move(stages), std::move(pipeline), static_cast<size_t>(unit)));
}

} // namespace mipgen::engine
