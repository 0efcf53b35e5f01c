/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/Common.h>
#include <mipgen/Shader.h>
#include <mipgen/Texture.h>
#include <unordered_map>
#include <vector>

namespace mipgen {

/*
 * @brief Values used to specify a mask to permit or restrict writing to color channels of a color
 * value. The values red, green, blue, and alpha select one color channel each, and they can be
 * bitwise combined.
 */
using ColorWriteMask = uint8_t;
enum ColorWriteBits : uint8_t {
  ColorWriteBitsDisabled = 0,
  ColorWriteBitsRed = 1 << 0,
  ColorWriteBitsGreen = 1 << 1,
  ColorWriteBitsBlue = 1 << 2,
  ColorWriteBitsAlpha = 1 << 3,
  ColorWriteBitsAll =
      ColorWriteBitsRed | ColorWriteBitsGreen | ColorWriteBitsBlue | ColorWriteBitsAlpha,
};

/*
 * @brief An argument of options you pass to a device to get a render pipeline state object.
 *
 * Pipelines take no vertex input: geometry is generated in the vertex shader.
 */
struct RenderPipelineDesc {
  struct TargetDesc {
    /*
     * @brief Description of render pipeline's color render target
     */
    struct ColorAttachment {
      TextureFormat textureFormat = TextureFormat::Invalid;
      /*
       * @brief Identify which color channels are written.
       */
      ColorWriteMask colorWriteMask = ColorWriteBitsAll;

      bool operator==(const ColorAttachment& other) const;
      bool operator!=(const ColorAttachment& other) const;
    };

    /*
     * @brief Array of attachments that store color data
     */
    std::vector<ColorAttachment> colorAttachments;

    bool operator==(const TargetDesc& other) const;
    bool operator!=(const TargetDesc& other) const;
  };

  /*
   * @brief Describes the vertex and fragment functions
   */
  std::shared_ptr<IShaderStages> shaderStages;

  TargetDesc targetDesc;

  /*
   * GL Only: Mapping of Texture Unit <-> Sampler Name.
   * Texture unit should be < MIPGEN_TEXTURE_SAMPLERS_MAX. When empty, units are inferred from the
   * linked program: active sampler uniforms get consecutive units in reflection order.
   */
  std::unordered_map<size_t, std::string> fragmentUnitSamplerMap;

  std::string debugName;

  bool operator==(const RenderPipelineDesc& other) const;
  bool operator!=(const RenderPipelineDesc& other) const;
};

class IRenderPipelineState {
 public:
  explicit IRenderPipelineState(const RenderPipelineDesc& desc) : desc_(desc) {}
  virtual ~IRenderPipelineState() = default;

  /*
   * @brief Returns the texture unit bound to the named sampler in `stage`, or -1.
   */
  [[nodiscard]] virtual int getIndexByName(const std::string& /* name */,
                                           ShaderStage /* stage */) const {
    return -1;
  }

  [[nodiscard]] const RenderPipelineDesc& getRenderPipelineDesc() const {
    return desc_;
  }

 protected:
  const RenderPipelineDesc desc_{};
};

} // namespace mipgen
