/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Device.h"

#include "Commands.h"
#include "Resources.h"
#include "Surface.h"
#include "Texture.h"

#include <algorithm>

namespace mipgen::tests::util::recording {

Device::Device(DeviceConfig config, std::shared_ptr<Recording> recording) :
  config_(std::move(config)), recording_(std::move(recording)) {}

std::shared_ptr<BindGroup> Device::createBindGroup(const BindGroupDesc& desc,
                                                   const IRenderPipelineState* compatiblePipeline,
                                                   Result* outResult) {
  if (compatiblePipeline && !desc.textures[0]) {
    Result::setResult(outResult,
                      Result::Code::ArgumentInvalid,
                      "Pipeline reads unit 0 but the bind group has no texture there");
    return nullptr;
  }
  auto bindGroup = std::make_shared<BindGroup>(desc);
  bindGroups_.push_back(bindGroup);
  Result::setOk(outResult);
  return bindGroup;
}

size_t Device::getLiveBindGroupCount() const {
  return static_cast<size_t>(
      std::count_if(bindGroups_.begin(), bindGroups_.end(), [](const auto& bindGroup) {
        return !bindGroup.expired();
      }));
}

std::shared_ptr<ICommandQueue> Device::createCommandQueue(const CommandQueueDesc& /*desc*/,
                                                          Result* outResult) {
  if (!commandQueue_) {
    commandQueue_ = std::make_shared<CommandQueue>(recording_);
  }
  Result::setOk(outResult);
  return commandQueue_;
}

std::shared_ptr<ISamplerState> Device::createSamplerState(const SamplerStateDesc& desc,
                                                          Result* outResult) {
  recording_->samplersCreated++;
  Result::setOk(outResult);
  return std::make_shared<SamplerState>(desc);
}

std::shared_ptr<ITexture> Device::createTexture(const TextureDesc& desc,
                                                Result* outResult) const noexcept {
  const TextureDesc sanitized = sanitize(desc);
  if (sanitized.type != TextureType::TwoD || sanitized.format == TextureFormat::Invalid) {
    Result::setResult(outResult, Result::Code::ArgumentInvalid, "Only valid 2D textures");
    return nullptr;
  }
  if (sanitized.width > config_.maxTextureDimension ||
      sanitized.height > config_.maxTextureDimension) {
    Result::setResult(outResult, Result::Code::ArgumentOutOfRange, "Texture too large");
    return nullptr;
  }
  if (sanitized.numMipLevels >
      TextureDesc::calcNumMipLevels(sanitized.width, sanitized.height)) {
    Result::setResult(outResult, Result::Code::ArgumentOutOfRange, "Too many mip levels");
    return nullptr;
  }
  const auto caps = getTextureFormatCapabilities(sanitized.format);
  if ((sanitized.usage & TextureDesc::TextureUsageBits::Attachment) != 0 &&
      !contains(caps, TextureFormatCapabilityBits::Attachment)) {
    Result::setResult(outResult, Result::Code::UnsupportedFormat, "Format is not renderable");
    return nullptr;
  }

  recording_->texturesCreated++;
  Result::setOk(outResult);
  return std::make_shared<Texture>(sanitized, recording_);
}

std::shared_ptr<ITexture> Device::createTextureView(std::shared_ptr<ITexture> texture,
                                                    const TextureViewDesc& desc,
                                                    Result* outResult) const noexcept {
  auto parent = std::dynamic_pointer_cast<Texture>(std::move(texture));
  if (!parent) {
    Result::setResult(outResult, Result::Code::ArgumentNull, "Not a recording texture");
    return nullptr;
  }
  if (desc.numMipLevels == 0 ||
      desc.mipLevel + desc.numMipLevels > parent->getNumMipLevels()) {
    Result::setResult(outResult, Result::Code::ArgumentOutOfRange, "View range out of bounds");
    return nullptr;
  }
  Result::setOk(outResult);
  return std::make_shared<Texture>(std::move(parent), desc);
}

std::shared_ptr<IRenderPipelineState> Device::createRenderPipeline(const RenderPipelineDesc& desc,
                                                                   Result* outResult) const {
  if (!desc.shaderStages) {
    Result::setResult(outResult, Result::Code::ArgumentNull, "Missing shader stages");
    return nullptr;
  }
  recording_->pipelinesCreated++;
  Result::setOk(outResult);
  return std::make_shared<RenderPipelineState>(desc);
}

std::shared_ptr<IShaderModule> Device::createShaderModule(const ShaderModuleDesc& desc,
                                                          Result* outResult) const {
  if (!desc.isValid()) {
    Result::setResult(outResult, Result::Code::ArgumentInvalid, "Empty shader source");
    return nullptr;
  }
  if (config_.failShaderCompile) {
    Result::setResult(outResult, Result::Code::RuntimeError, "Shader compilation failed");
    return nullptr;
  }
  recording_->shaderModulesCreated++;
  Result::setOk(outResult);
  return std::make_shared<ShaderModule>(desc.info);
}

std::unique_ptr<IShaderStages> Device::createShaderStages(const ShaderStagesDesc& desc,
                                                          Result* outResult) const {
  if (!desc.vertexModule || !desc.fragmentModule) {
    Result::setResult(outResult, Result::Code::ArgumentNull, "Missing shader module");
    return nullptr;
  }
  Result::setOk(outResult);
  return std::make_unique<ShaderStages>(desc);
}

std::shared_ptr<IFramebuffer> Device::createFramebuffer(const FramebufferDesc& desc,
                                                        Result* outResult) {
  const auto& texture = desc.colorAttachments[0].texture;
  if (!texture || (texture->getUsage() & TextureDesc::TextureUsageBits::Attachment) == 0) {
    Result::setResult(outResult, Result::Code::ArgumentInvalid, "Attachment usage required");
    return nullptr;
  }
  if (config_.framebufferLimit && recording_->framebuffersCreated >= *config_.framebufferLimit) {
    Result::setResult(outResult, Result::Code::RuntimeError, "Out of framebuffers");
    return nullptr;
  }
  recording_->framebuffersCreated++;
  Result::setOk(outResult);
  return std::make_shared<Framebuffer>(desc);
}

std::shared_ptr<ISurface> Device::createSurface(IWindow& window, Result* outResult) {
  if (window.getNativeWindow() == 0) {
    Result::setResult(outResult, Result::Code::ArgumentInvalid, "No native window");
    return nullptr;
  }
  Result::setOk(outResult);
  return std::make_shared<Surface>(config_, recording_);
}

bool Device::hasFeature(DeviceFeatures feature) const {
  if (feature == DeviceFeatures::PremultipliedAlphaSurface) {
    return config_.supportsPremultipliedAlpha;
  }
  return true;
}

ICapabilities::TextureFormatCapabilities Device::getTextureFormatCapabilities(
    TextureFormat format) const {
  auto it = config_.formatCapabilities.find(format);
  if (it != config_.formatCapabilities.end()) {
    return it->second;
  }
  const auto properties = TextureFormatProperties::fromTextureFormat(format);
  if (!properties.isValid()) {
    return TextureFormatCapabilityBits::Unsupported;
  }
  if (properties.isDepthOrStencil() || properties.isInteger()) {
    return TextureFormatCapabilityBits::Sampled | TextureFormatCapabilityBits::Attachment;
  }
  return TextureFormatCapabilityBits::All;
}

bool Device::getFeatureLimits(DeviceFeatureLimits featureLimits, size_t& result) const {
  switch (featureLimits) {
  case DeviceFeatureLimits::MaxTextureDimension1D2D:
    result = config_.maxTextureDimension;
    return true;
  case DeviceFeatureLimits::MaxTextureSamplers:
    result = MIPGEN_TEXTURE_SAMPLERS_MAX;
    return true;
  }
  MIPGEN_UNREACHABLE_RETURN(false)
}

///--------------------------------------
/// MARK: - HWDevice

HWDevice::HWDevice(DeviceConfig config, std::shared_ptr<Recording> recording) :
  config_(std::move(config)), recording_(std::move(recording)) {
  adapters.emplace_back(1, HWDeviceType::IntegratedGpu, 0, "Recording GPU", "mipgen");
}

std::vector<HWDeviceDesc> HWDevice::queryDevices(const HWDeviceQueryDesc& /*desc*/,
                                                 Result* outResult) {
  Result::setOk(outResult);
  return adapters;
}

std::unique_ptr<IDevice> HWDevice::create(const HWDeviceDesc& desc, Result* outResult) {
  lastCreatedGuid = desc.guid;
  if (failCreate) {
    Result::setResult(outResult, Result::Code::RuntimeError, "Device creation disabled");
    return nullptr;
  }
  Result::setOk(outResult);
  return std::make_unique<Device>(config_, recording_);
}

} // namespace mipgen::tests::util::recording
