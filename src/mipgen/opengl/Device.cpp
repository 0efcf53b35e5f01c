/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/opengl/Device.h>

#include <mipgen/Format.h>
#include <mipgen/opengl/CommandQueue.h>
#include <mipgen/opengl/Framebuffer.h>
#include <mipgen/opengl/RenderPipelineState.h>
#include <mipgen/opengl/SamplerState.h>
#include <mipgen/opengl/Shader.h>
#include <mipgen/opengl/Texture.h>
#include <string>

namespace mipgen::opengl {

Device::Device(std::unique_ptr<IContext> context) : context_(std::move(context)) {}

Device::~Device() = default;

std::shared_ptr<BindGroup> Device::createBindGroup(
    const BindGroupDesc& desc,
    const IRenderPipelineState* MIPGEN_NULLABLE compatiblePipeline,
    Result* MIPGEN_NULLABLE outResult) {
  MIPGEN_DEBUG_ASSERT(!desc.debugName.empty(), "Each bind group should have a debug name");

  if (compatiblePipeline != nullptr) {
    // every unit the fragment program samples needs a texture
    const auto& pipeline = static_cast<const RenderPipelineState&>(*compatiblePipeline);
    for (size_t unit = 0; unit < MIPGEN_TEXTURE_SAMPLERS_MAX; ++unit) {
      if (pipeline.hasTextureUnit(unit) && !desc.textures[unit]) {
        Result::setResult(outResult,
                          Result::Code::ArgumentInvalid,
                          MIPGEN_FORMAT("Bind group '{}' leaves sampled unit {} empty",
                                        desc.debugName,
                                        unit));
        return nullptr;
      }
    }
  }

  Result::setOk(outResult);
  return std::make_shared<BindGroup>(desc);
}

std::shared_ptr<ICommandQueue> Device::createCommandQueue(const CommandQueueDesc& /*desc*/,
                                                          Result* outResult) {
  if (!commandQueue_) {
    commandQueue_ = std::make_shared<CommandQueue>(context_);
  }
  Result::setOk(outResult);
  return commandQueue_;
}

std::shared_ptr<ISamplerState> Device::createSamplerState(const SamplerStateDesc& desc,
                                                          Result* outResult) {
  auto resource = std::make_shared<SamplerState>(*context_, desc);
  auto result = resource->create();
  if (!result.isOk()) {
    Result::setResult(outResult, std::move(result));
    return nullptr;
  }
  Result::setOk(outResult);
  return resource;
}

std::shared_ptr<ITexture> Device::createTexture(const TextureDesc& desc,
                                                Result* outResult) const noexcept {
  const auto sanitized = sanitize(desc);

  const auto capabilities = getTextureFormatCapabilities(sanitized.format);
  const bool needsSampled = (sanitized.usage & TextureDesc::TextureUsageBits::Sampled) != 0;
  const bool needsAttachment = (sanitized.usage & TextureDesc::TextureUsageBits::Attachment) != 0;
  if ((needsSampled && !contains(capabilities, TextureFormatCapabilityBits::Sampled)) ||
      (needsAttachment && !contains(capabilities, TextureFormatCapabilityBits::Attachment))) {
    Result::setResult(outResult,
                      Result::Code::UnsupportedFormat,
                      std::string("Texture format does not support the requested usage: ") +
                          TextureFormatProperties::fromTextureFormat(sanitized.format).name);
    return nullptr;
  }

  auto texture = std::make_shared<Texture>(*context_, sanitized.format);
  auto result = texture->create(sanitized);
  if (!result.isOk()) {
    Result::setResult(outResult, std::move(result));
    return nullptr;
  }
  Result::setOk(outResult);
  return texture;
}

std::shared_ptr<ITexture> Device::createTextureView(std::shared_ptr<ITexture> texture,
                                                    const TextureViewDesc& desc,
                                                    Result* outResult) const noexcept {
  if (!texture) {
    Result::setResult(outResult, Result::Code::ArgumentNull, "texture is null");
    return nullptr;
  }
  if (desc.format != TextureFormat::Invalid && desc.format != texture->getFormat()) {
    Result::setResult(
        outResult, Result::Code::Unsupported, "Texture views cannot change the format");
    return nullptr;
  }
  if (desc.numMipLevels == 0 || desc.mipLevel + desc.numMipLevels > texture->getNumMipLevels()) {
    Result::setResult(outResult,
                      Result::Code::ArgumentOutOfRange,
                      "View levels [" + std::to_string(desc.mipLevel) + ", " +
                          std::to_string(desc.mipLevel + desc.numMipLevels) +
                          ") exceed the texture's " + std::to_string(texture->getNumMipLevels()) +
                          " levels");
    return nullptr;
  }

  // views of views resolve to the owning texture
  std::shared_ptr<Texture> storage = std::dynamic_pointer_cast<Texture>(texture);
  TextureViewDesc viewDesc = desc;
  if (!storage) {
    const auto view = std::dynamic_pointer_cast<TextureView>(texture);
    if (!view) {
      Result::setResult(outResult, Result::Code::ArgumentInvalid, "Not an OpenGL texture");
      return nullptr;
    }
    storage = view->getParent();
    viewDesc.mipLevel += view->getBaseMipLevel();
  }

  Result::setOk(outResult);
  return std::make_shared<TextureView>(std::move(storage), viewDesc);
}

std::shared_ptr<IRenderPipelineState> Device::createRenderPipeline(const RenderPipelineDesc& desc,
                                                                   Result* outResult) const {
  Result result;
  auto resource = std::make_shared<RenderPipelineState>(*context_, desc, &result);
  if (!result.isOk()) {
    Result::setResult(outResult, std::move(result));
    return nullptr;
  }
  Result::setOk(outResult);
  return resource;
}

std::shared_ptr<IShaderModule> Device::createShaderModule(const ShaderModuleDesc& desc,
                                                          Result* outResult) const {
  auto resource = std::make_shared<ShaderModule>(*context_, desc.info);
  auto result = resource->create(desc);
  if (!result.isOk()) {
    Result::setResult(outResult, std::move(result));
    return nullptr;
  }
  Result::setOk(outResult);
  return resource;
}

std::unique_ptr<IShaderStages> Device::createShaderStages(const ShaderStagesDesc& desc,
                                                          Result* outResult) const {
  auto resource = std::make_unique<ShaderStages>(desc, *context_);
  auto result = resource->create(desc);
  if (!result.isOk()) {
    Result::setResult(outResult, std::move(result));
    return nullptr;
  }
  Result::setOk(outResult);
  return resource;
}

std::shared_ptr<IFramebuffer> Device::createFramebuffer(const FramebufferDesc& desc,
                                                        Result* outResult) {
  auto resource = std::make_shared<CustomFramebuffer>(*context_);
  auto result = resource->initialize(desc);
  if (!result.isOk()) {
    Result::setResult(outResult, std::move(result));
    return nullptr;
  }
  Result::setOk(outResult);
  return resource;
}

std::shared_ptr<ISurface> Device::createSurface(IWindow& /*window*/, Result* outResult) {
  Result::setResult(
      outResult, Result::Code::Unsupported, "This context cannot create window surfaces");
  return nullptr;
}

bool Device::hasFeature(DeviceFeatures capability) const {
  return context_->deviceFeatures().hasFeature(capability);
}

bool Device::getFeatureLimits(DeviceFeatureLimits featureLimits, size_t& result) const {
  return context_->deviceFeatures().getFeatureLimits(featureLimits, result);
}

ICapabilities::TextureFormatCapabilities Device::getTextureFormatCapabilities(
    TextureFormat format) const {
  return context_->deviceFeatures().getTextureFormatCapabilities(format);
}

size_t Device::getCurrentDrawCount() const {
  return context_->getCurrentDrawCount();
}

} // namespace mipgen::opengl
