/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/BindGroup.h>
#include <mipgen/CommandBuffer.h>
#include <mipgen/CommandQueue.h>
#include <mipgen/Common.h>
#include <mipgen/DeviceFeatures.h>
#include <mipgen/Framebuffer.h>
#include <mipgen/RenderPass.h>
#include <mipgen/RenderPipelineState.h>
#include <mipgen/SamplerState.h>
#include <mipgen/Shader.h>
#include <mipgen/Surface.h>
#include <mipgen/Texture.h>
#include <mipgen/Window.h>

namespace mipgen {

/**
 * @interface IDevice
 * @brief Interface to a GPU that is used to draw graphics.
 */
class IDevice : public ICapabilities {
 public:
  ~IDevice() override = default;

  /**
   * @brief Creates a bind group for the textures and samplers in `desc`.
   * @param compatiblePipeline Optional pipeline the group is validated against: every sampler the
   * pipeline's fragment stage reads must have a texture in the group.
   */
  [[nodiscard]] virtual std::shared_ptr<BindGroup> createBindGroup(
      const BindGroupDesc& desc,
      const IRenderPipelineState* MIPGEN_NULLABLE compatiblePipeline = nullptr,
      Result* MIPGEN_NULLABLE outResult = nullptr) = 0;

  /**
   * @brief Creates a command queue.
   * @see mipgen::CommandQueueDesc
   * @param desc Description for the desired resource.
   * @param outResult Pointer to where the result (success, failure, etc) is written. Can be null if
   * no reporting is desired.
   * @return Shared pointer to the created queue.
   */
  virtual std::shared_ptr<ICommandQueue> createCommandQueue(
      const CommandQueueDesc& desc,
      Result* MIPGEN_NULLABLE outResult) = 0;

  /**
   * @brief Creates a sampler state.
   * @see mipgen::SamplerStateDesc
   */
  [[nodiscard]] virtual std::shared_ptr<ISamplerState> createSamplerState(
      const SamplerStateDesc& desc,
      Result* MIPGEN_NULLABLE outResult) = 0;

  /**
   * @brief Creates a texture resource.
   * @see mipgen::TextureDesc
   * @param desc Description for the desired resource.
   * @param outResult Pointer to where the result (success, failure, etc) is written. Can be null if
   * no reporting is desired.
   * @return Shared pointer to the created texture.
   */
  [[nodiscard]] virtual std::shared_ptr<ITexture> createTexture(
      const TextureDesc& desc,
      Result* MIPGEN_NULLABLE outResult) const noexcept = 0;

  /**
   * @brief Creates a view onto a range of mip levels of `texture`. The view keeps `texture`
   * alive; sampling it never reads levels outside the range.
   */
  [[nodiscard]] virtual std::shared_ptr<ITexture> createTextureView(
      std::shared_ptr<ITexture> texture,
      const TextureViewDesc& desc,
      Result* MIPGEN_NULLABLE outResult) const noexcept = 0;

  /**
   * @brief Creates a render pipeline state.
   * @see mipgen::RenderPipelineDesc
   */
  [[nodiscard]] virtual std::shared_ptr<IRenderPipelineState> createRenderPipeline(
      const RenderPipelineDesc& desc,
      Result* MIPGEN_NULLABLE outResult) const = 0;

  /**
   * @brief Creates a shader module from source code.
   * @see mipgen::ShaderModuleDesc
   */
  [[nodiscard]] virtual std::shared_ptr<IShaderModule> createShaderModule(
      const ShaderModuleDesc& desc,
      Result* MIPGEN_NULLABLE outResult) const = 0;

  /**
   * @brief Creates a shader stages object.
   * @see mipgen::ShaderStagesDesc
   */
  [[nodiscard]] virtual std::unique_ptr<IShaderStages> createShaderStages(
      const ShaderStagesDesc& desc,
      Result* MIPGEN_NULLABLE outResult) const = 0;

  /**
   * @brief Creates a frame buffer object.
   * @see mipgen::FramebufferDesc
   */
  [[nodiscard]] virtual std::shared_ptr<IFramebuffer> createFramebuffer(
      const FramebufferDesc& desc,
      Result* MIPGEN_NULLABLE outResult) = 0;

  /**
   * @brief Creates a presentation surface for a platform window.
   */
  [[nodiscard]] virtual std::shared_ptr<ISurface> createSurface(
      IWindow& window,
      Result* MIPGEN_NULLABLE outResult) = 0;

  /**
   * @brief Returns the actual graphics API backing this device (Metal, OpenGL, etc).
   */
  [[nodiscard]] virtual BackendType getBackendType() const = 0;

 protected:
  /**
   * @brief Clamps zero-sized dimensions and level counts of `desc` to 1, logging the fix-up.
   */
  [[nodiscard]] TextureDesc sanitize(const TextureDesc& desc) const;

  IDevice() = default;
};

} // namespace mipgen
