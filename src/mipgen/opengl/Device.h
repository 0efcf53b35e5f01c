/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/Device.h>
#include <mipgen/opengl/IContext.h>

namespace mipgen::opengl {

class CommandQueue;

/**
 * @brief GL ES 3 device. Owns the context every resource it creates is bound to; all calls must be
 * made on the thread where that context is current. Window surfaces are created by egl::Device.
 */
class Device : public IDevice {
 public:
  explicit Device(std::unique_ptr<IContext> context);
  ~Device() override;

  [[nodiscard]] BackendType getBackendType() const override {
    return BackendType::OpenGL;
  }

  [[nodiscard]] IContext& getContext() const {
    return *context_;
  }

  /// Draw calls issued on this device's context so far.
  [[nodiscard]] size_t getCurrentDrawCount() const;

  ///--------------------------------------
  /// MARK: - Textures and samplers

  std::shared_ptr<ITexture> createTexture(const TextureDesc& desc,
                                          Result* MIPGEN_NULLABLE
                                              outResult) const noexcept override;
  std::shared_ptr<ITexture> createTextureView(std::shared_ptr<ITexture> texture,
                                              const TextureViewDesc& desc,
                                              Result* MIPGEN_NULLABLE
                                                  outResult) const noexcept override;
  std::shared_ptr<ISamplerState> createSamplerState(const SamplerStateDesc& desc,
                                                    Result* MIPGEN_NULLABLE outResult) override;
  /// Fails unless every texture unit `compatiblePipeline` samples has a texture.
  [[nodiscard]] std::shared_ptr<BindGroup> createBindGroup(
      const BindGroupDesc& desc,
      const IRenderPipelineState* MIPGEN_NULLABLE compatiblePipeline,
      Result* MIPGEN_NULLABLE outResult) override;

  ///--------------------------------------
  /// MARK: - Mip pass objects

  std::shared_ptr<IShaderModule> createShaderModule(const ShaderModuleDesc& desc,
                                                    Result* MIPGEN_NULLABLE
                                                        outResult) const override;
  std::unique_ptr<IShaderStages> createShaderStages(const ShaderStagesDesc& desc,
                                                    Result* MIPGEN_NULLABLE
                                                        outResult) const override;
  std::shared_ptr<IRenderPipelineState> createRenderPipeline(const RenderPipelineDesc& desc,
                                                             Result* MIPGEN_NULLABLE
                                                                 outResult) const override;
  std::shared_ptr<IFramebuffer> createFramebuffer(const FramebufferDesc& desc,
                                                  Result* MIPGEN_NULLABLE outResult) override;
  /// GL has a single queue; every call returns the same one.
  std::shared_ptr<ICommandQueue> createCommandQueue(const CommandQueueDesc& desc,
                                                    Result* MIPGEN_NULLABLE outResult) override;

  /// Unsupported here; egl::Device overrides it.
  std::shared_ptr<ISurface> createSurface(IWindow& window,
                                          Result* MIPGEN_NULLABLE outResult) override;

  ///--------------------------------------
  /// MARK: - ICapabilities

  [[nodiscard]] bool hasFeature(DeviceFeatures capability) const override;
  bool getFeatureLimits(DeviceFeatureLimits featureLimits, size_t& result) const override;
  [[nodiscard]] TextureFormatCapabilities getTextureFormatCapabilities(
      TextureFormat format) const override;

 private:
  const std::shared_ptr<IContext> context_;
  std::shared_ptr<CommandQueue> commandQueue_;
};

} // namespace mipgen::opengl
