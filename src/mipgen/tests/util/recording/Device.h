/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "Recording.h"

namespace mipgen::tests::util::recording {

class CommandQueue;

/// In-memory IDevice. Creates resources without touching a GPU and records what is encoded.
class Device final : public IDevice {
 public:
  Device(DeviceConfig config, std::shared_ptr<Recording> recording);

  std::shared_ptr<BindGroup> createBindGroup(
      const BindGroupDesc& desc,
      const IRenderPipelineState* MIPGEN_NULLABLE compatiblePipeline,
      Result* MIPGEN_NULLABLE outResult) override;

  std::shared_ptr<ICommandQueue> createCommandQueue(const CommandQueueDesc& desc,
                                                    Result* MIPGEN_NULLABLE outResult) override;
  [[nodiscard]] std::shared_ptr<ISamplerState> createSamplerState(
      const SamplerStateDesc& desc,
      Result* MIPGEN_NULLABLE outResult) override;
  [[nodiscard]] std::shared_ptr<ITexture> createTexture(
      const TextureDesc& desc,
      Result* MIPGEN_NULLABLE outResult) const noexcept override;
  [[nodiscard]] std::shared_ptr<ITexture> createTextureView(
      std::shared_ptr<ITexture> texture,
      const TextureViewDesc& desc,
      Result* MIPGEN_NULLABLE outResult) const noexcept override;
  [[nodiscard]] std::shared_ptr<IRenderPipelineState> createRenderPipeline(
      const RenderPipelineDesc& desc,
      Result* MIPGEN_NULLABLE outResult) const override;
  [[nodiscard]] std::shared_ptr<IShaderModule> createShaderModule(
      const ShaderModuleDesc& desc,
      Result* MIPGEN_NULLABLE outResult) const override;
  [[nodiscard]] std::unique_ptr<IShaderStages> createShaderStages(
      const ShaderStagesDesc& desc,
      Result* MIPGEN_NULLABLE outResult) const override;
  [[nodiscard]] std::shared_ptr<IFramebuffer> createFramebuffer(
      const FramebufferDesc& desc,
      Result* MIPGEN_NULLABLE outResult) override;
  [[nodiscard]] std::shared_ptr<ISurface> createSurface(IWindow& window,
                                                        Result* MIPGEN_NULLABLE outResult) override;

  [[nodiscard]] bool hasFeature(DeviceFeatures feature) const override;
  [[nodiscard]] TextureFormatCapabilities getTextureFormatCapabilities(
      TextureFormat format) const override;
  bool getFeatureLimits(DeviceFeatureLimits featureLimits, size_t& result) const override;
  [[nodiscard]] BackendType getBackendType() const override {
    return BackendType::Custom;
  }

  [[nodiscard]] const DeviceConfig& getConfig() const noexcept {
    return config_;
  }
  /// Number of bind groups created by this device that are still referenced.
  [[nodiscard]] size_t getLiveBindGroupCount() const;

 private:
  const DeviceConfig config_;
  std::shared_ptr<Recording> recording_;
  std::shared_ptr<CommandQueue> commandQueue_;
  std::vector<std::weak_ptr<BindGroup>> bindGroups_;
};

/// Reports a configurable list of adapters; every adapter creates a recording Device.
class HWDevice final : public IHWDeviceProvider {
 public:
  HWDevice(DeviceConfig config, std::shared_ptr<Recording> recording);

  std::vector<HWDeviceDesc> queryDevices(const HWDeviceQueryDesc& desc,
                                         Result* MIPGEN_NULLABLE outResult) override;
  std::unique_ptr<IDevice> create(const HWDeviceDesc& desc,
                                  Result* MIPGEN_NULLABLE outResult) override;

  std::vector<HWDeviceDesc> adapters;
  bool failCreate = false;
  /// guid of the adapter the last create() call was given.
  uintptr_t lastCreatedGuid = 0;

 private:
  const DeviceConfig config_;
  std::shared_ptr<Recording> recording_;
};

} // namespace mipgen::tests::util::recording
