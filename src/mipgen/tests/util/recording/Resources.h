/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "Recording.h"
#include "Texture.h"

namespace mipgen::tests::util::recording {

class SamplerState final : public ISamplerState {
 public:
  explicit SamplerState(SamplerStateDesc desc) : desc_(std::move(desc)) {}
  [[nodiscard]] const SamplerStateDesc& getDesc() const noexcept {
    return desc_;
  }

 private:
  const SamplerStateDesc desc_;
};

class ShaderModule final : public IShaderModule {
 public:
  explicit ShaderModule(ShaderModuleInfo info) : IShaderModule(std::move(info)) {}
};

class ShaderStages final : public IShaderStages {
 public:
  explicit ShaderStages(ShaderStagesDesc desc) : IShaderStages(std::move(desc)) {}
};

/// Every pipeline reads one sampler, "uSourceLevel", from unit 0.
class RenderPipelineState final : public IRenderPipelineState {
 public:
  explicit RenderPipelineState(const RenderPipelineDesc& desc) : IRenderPipelineState(desc) {}
  [[nodiscard]] int getIndexByName(const std::string& name, ShaderStage stage) const override;
};

class Framebuffer final : public IFramebuffer {
 public:
  explicit Framebuffer(const FramebufferDesc& desc) : desc_(desc) {}

  [[nodiscard]] std::vector<size_t> getColorAttachmentIndices() const override;
  [[nodiscard]] std::shared_ptr<ITexture> getColorAttachment(size_t index) const override;
  void copyBytesColorAttachment(ICommandQueue& cmdQueue,
                                size_t index,
                                void* MIPGEN_NONNULL pixelBytes,
                                const TextureRangeDesc& range,
                                size_t bytesPerRow) const override;

 private:
  const FramebufferDesc desc_;
};

} // namespace mipgen::tests::util::recording
