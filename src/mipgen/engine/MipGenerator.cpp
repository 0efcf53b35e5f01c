/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/engine/MipGenerator.h>

#include <algorithm>
#include <mipgen/Format.h>
#include <vector>

namespace mipgen::engine {

namespace {

/// Resources for rendering level `dstLevel - 1` into `dstLevel`.
struct LevelPass {
  uint32_t dstLevel = 0;
  uint32_t width = 0;
  uint32_t height = 0;
  std::shared_ptr<BindGroup> bindGroup;
  std::shared_ptr<IFramebuffer> framebuffer;
};

} // namespace

MipGenerator::MipGenerator(DeviceContext& context, PipelineCache& cache, MipGeneratorDesc desc) :
  context_(context), cache_(cache), desc_(std::move(desc)) {}

bool MipGenerator::init(Result* outResult) {
  if (sampler_) {
    Result::setOk(outResult);
    return true;
  }

  IDevice* device = context_.device(outResult);
  if (!device) {
    return false;
  }

  SamplerStateDesc samplerDesc = SamplerStateDesc::newLinear();
  samplerDesc.addressModeU = SamplerAddressMode::Clamp;
  samplerDesc.addressModeV = SamplerAddressMode::Clamp;
  samplerDesc.debugName = context_.label() + "/mip gen sampler";

  Result result;
  sampler_ = device->createSamplerState(samplerDesc, &result);
  if (!result.isOk() || !sampler_) {
    sampler_ = nullptr;
    Result::setResult(outResult, std::move(result));
    return false;
  }

  Result::setOk(outResult);
  return true;
}

std::shared_ptr<ISamplerState> MipGenerator::sampler(Result* outResult) const {
  if (!sampler_) {
    Result::setResult(outResult, Result::Code::NotInitialized, "MipGenerator::init() not called");
    return nullptr;
  }
  Result::setOk(outResult);
  return sampler_;
}

uint32_t MipGenerator::countLevels(std::initializer_list<int64_t> sizes) {
  const int64_t maxSize = sizes.size() ? std::max(sizes) : 0;
  if (maxSize <= 0) {
    MIPGEN_SOFT_ERROR("countLevels() needs a positive size (got %lld)",
                      static_cast<long long>(maxSize));
    return 0;
  }

  uint32_t levels = 1;
  while (static_cast<uint64_t>(maxSize) >> levels) {
    levels++;
  }
  return levels;
}

MipGenerationResult MipGenerator::generate(const std::shared_ptr<ITexture>& texture,
                                           uint32_t levelCount,
                                           Result* outResult) {
  MipGenerationResult generation;

  if (!sampler_) {
    Result::setResult(outResult, Result::Code::NotInitialized, "MipGenerator::init() not called");
    return generation;
  }
  if (!MIPGEN_DEBUG_VERIFY(texture)) {
    Result::setResult(outResult, Result::Code::ArgumentNull, "texture is null");
    return generation;
  }

  IDevice* device = context_.device(outResult);
  auto commandQueue = context_.commandQueue(outResult);
  if (!device || !commandQueue) {
    return generation;
  }

  if ((texture->getUsage() & TextureDesc::TextureUsageBits::Attachment) == 0) {
    Result::setResult(outResult,
                      Result::Code::ArgumentInvalid,
                      "Mip generation renders into the texture: Attachment usage is required");
    return generation;
  }

  const Dimensions dims = texture->getDimensions();
  const uint32_t allocatedLevels = texture->getNumMipLevels();
  uint32_t requestedLevels = levelCount ? levelCount : countLevels(dims.width, dims.height);
  if (requestedLevels > allocatedLevels) {
    if (!desc_.clampLevelCount) {
      Result::setResult(outResult,
                        Result::Code::ArgumentOutOfRange,
                        MIPGEN_FORMAT("{} levels requested, texture holds {}",
                                      requestedLevels,
                                      allocatedLevels));
      return generation;
    }
    MIPGEN_LOG_INFO("[%s] Clamping %u requested mip levels to the %u allocated\n",
                    context_.label().c_str(),
                    requestedLevels,
                    allocatedLevels);
    requestedLevels = allocatedLevels;
  }

  if (requestedLevels <= 1) {
    Result::setOk(outResult);
    return generation;
  }

  Result result;
  auto program = cache_.getProgram(texture->getFormat(), &result);
  if (!program) {
    Result::setResult(outResult, std::move(result));
    return generation;
  }

  // Every level's view, bind group and framebuffer is created before the first pass is
  // encoded, so a failure here leaves the texture untouched.
  std::vector<LevelPass> passes;
  uint32_t width = dims.width;
  uint32_t height = dims.height;
  for (uint32_t level = 0; level < requestedLevels - 1 && (width > 1 || height > 1); ++level) {
    width = std::max(width / 2, 1u);
    height = std::max(height / 2, 1u);

    LevelPass pass;
    pass.dstLevel = level + 1;
    pass.width = width;
    pass.height = height;

    TextureViewDesc viewDesc;
    viewDesc.mipLevel = level;
    viewDesc.numMipLevels = 1;
    viewDesc.debugName = MIPGEN_FORMAT("mip source {}", level);
    auto sourceView = device->createTextureView(texture, viewDesc, &result);
    if (!result.isOk() || !sourceView) {
      Result::setResult(outResult, std::move(result));
      return generation;
    }

    BindGroupDesc bindGroupDesc;
    bindGroupDesc.textures[program->sourceUnit()] = std::move(sourceView);
    bindGroupDesc.samplers[program->sourceUnit()] = sampler_;
    bindGroupDesc.debugName = MIPGEN_FORMAT("mip bind group {}", level);
    pass.bindGroup = device->createBindGroup(bindGroupDesc, program->pipeline().get(), &result);
    if (!result.isOk() || !pass.bindGroup) {
      Result::setResult(outResult, std::move(result));
      return generation;
    }

    FramebufferDesc framebufferDesc;
    framebufferDesc.colorAttachments[0].texture = texture;
    framebufferDesc.debugName = MIPGEN_FORMAT("mip target {}", pass.dstLevel);
    pass.framebuffer = device->createFramebuffer(framebufferDesc, &result);
    if (!result.isOk() || !pass.framebuffer) {
      Result::setResult(outResult, std::move(result));
      return generation;
    }

    passes.push_back(std::move(pass));
  }

  auto commandBuffer =
      commandQueue->createCommandBuffer(CommandBufferDesc{desc_.commandBufferLabel}, &result);
  if (!result.isOk() || !commandBuffer) {
    Result::setResult(outResult, std::move(result));
    return generation;
  }

  for (const auto& pass : passes) {
    RenderPassDesc renderPass;
    renderPass.colorAttachments.resize(1);
    renderPass.colorAttachments[0].loadAction = LoadAction::Clear;
    renderPass.colorAttachments[0].storeAction = StoreAction::Store;
    renderPass.colorAttachments[0].mipLevel = static_cast<uint8_t>(pass.dstLevel);
    renderPass.colorAttachments[0].clearColor = desc_.clearColor;
    renderPass.debugName = MIPGEN_FORMAT("{} {}", desc_.renderPassLabel, pass.dstLevel);

    auto encoder =
        commandBuffer->createRenderCommandEncoder(renderPass, pass.framebuffer, &result);
    if (!result.isOk() || !encoder) {
      // Earlier passes may already have written their levels on immediate-mode backends.
      Result::setResult(outResult, std::move(result));
      return generation;
    }

    Viewport viewport;
    viewport.width = static_cast<float>(pass.width);
    viewport.height = static_cast<float>(pass.height);
    encoder->bindViewport(viewport);
    encoder->bindRenderPipelineState(program->pipeline());
    encoder->bindBindGroup(*pass.bindGroup);
    encoder->draw(6);
    encoder->endEncoding();
  }

  generation.generatedLevels = static_cast<uint32_t>(passes.size());
  generation.submitHandle = commandQueue->submit(*commandBuffer);
  generation.commandBuffer = std::move(commandBuffer);

  MIPGEN_LOG_DEBUG("[%s] Generated %u mip levels (%ux%u)\n",
                   context_.label().c_str(),
                   generation.generatedLevels,
                   dims.width,
                   dims.height);

  Result::setOk(outResult);
  return generation;
}

} // namespace mipgen::engine
