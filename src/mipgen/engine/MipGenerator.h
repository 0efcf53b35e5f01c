/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <initializer_list>
#include <memory>
#include <mipgen/engine/DeviceContext.h>
#include <mipgen/engine/PipelineCache.h>

namespace mipgen::engine {

struct MipGeneratorDesc {
  Color clearColor = Color(0.0f, 0.0f, 0.0f, 1.0f);
  std::string commandBufferLabel = "mip gen encoder";
  /// Each pass is named "<renderPassLabel> <destination level>".
  std::string renderPassLabel = "mipmap renderPass";
  /// When false, asking for more levels than the texture holds fails with ArgumentOutOfRange
  /// instead of being clamped.
  bool clampLevelCount = true;
};

struct MipGenerationResult {
  /// Number of levels rendered, one per pass. The chain holds `1 + generatedLevels` levels.
  uint32_t generatedLevels = 0;
  /// 0 when nothing was submitted.
  SubmitHandle submitHandle = 0;
  std::shared_ptr<ICommandBuffer> commandBuffer;
};

///--------------------------------------
/// MARK: - MipGenerator

/// Fills levels 1..N-1 of a texture by rendering each level into the next with a bilinear
/// full-screen pass. All passes of one call go into a single command buffer.
class MipGenerator final {
 public:
  MipGenerator(DeviceContext& context, PipelineCache& cache, MipGeneratorDesc desc = {});

  /// Creates the shared sampler. Requires a ready DeviceContext.
  bool init(Result* MIPGEN_NULLABLE outResult = nullptr);
  [[nodiscard]] bool ready() const noexcept {
    return sampler_ != nullptr;
  }

  [[nodiscard]] std::shared_ptr<ISamplerState> sampler(
      Result* MIPGEN_NULLABLE outResult = nullptr) const;

  /// floor(1 + log2(max(sizes))). Returns 0 when the largest size is not positive.
  static uint32_t countLevels(std::initializer_list<int64_t> sizes);

  template<typename... Dims>
  static uint32_t countLevels(Dims... dims) {
    return countLevels({static_cast<int64_t>(dims)...});
  }

  /**
   * @brief Renders levels 1..levelCount-1 of `texture` from its level 0.
   *
   * @param levelCount Length of the resulting chain. 0 means the full chain for the texture size.
   * Values above the texture's allocated levels are clamped (see MipGeneratorDesc).
   * @remark Returns once the work is submitted. Wait on MipGenerationResult::commandBuffer to
   * block until the GPU is done.
   */
  MipGenerationResult generate(const std::shared_ptr<ITexture>& texture,
                               uint32_t levelCount = 0,
                               Result* MIPGEN_NULLABLE outResult = nullptr);

  [[nodiscard]] const MipGeneratorDesc& desc() const noexcept {
    return desc_;
  }

 private:
  DeviceContext& context_;
  PipelineCache& cache_;
  const MipGeneratorDesc desc_;
  std::shared_ptr<ISamplerState> sampler_;
};

} // namespace mipgen::engine
