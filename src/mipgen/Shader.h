/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/Common.h>
#include <utility>

namespace mipgen {

/**
 * @brief Type of shader stage in the rendering pipeline.
 */
enum class ShaderStage : uint8_t {
  /** @brief Vertex shader. */
  Vertex,
  /** @brief Fragment shader. */
  Fragment,
};

/**
 * @brief Metadata about a shader module.
 */
struct ShaderModuleInfo {
  /** @brief The module's shader stage. */
  ShaderStage stage = ShaderStage::Fragment;
  /** @brief The module's entry point. */
  std::string entryPoint;

  bool operator==(const ShaderModuleInfo& other) const;
  bool operator!=(const ShaderModuleInfo& other) const;
};

/**
 * @brief Descriptor used to construct a shader module from source code.
 * @see mipgen::IDevice::createShaderModule
 */
struct ShaderModuleDesc {
  /** @brief Metadata about the shader module. */
  ShaderModuleInfo info;
  /** @brief Null-terminated string containing shader source code. */
  const char* MIPGEN_NULLABLE source = nullptr;
  /** @brief The module's debug name. */
  std::string debugName;

  /**
   * @brief Constructs a ShaderModuleDesc for a shader from source code.
   * @param source Null-terminated string containing shader source code. Must outlive the call to
   * IDevice::createShaderModule.
   * @param info Shader module metadata.
   * @param debugName Debug name for the shader module.
   */
  static ShaderModuleDesc fromStringInput(const char* MIPGEN_NONNULL source,
                                          ShaderModuleInfo info,
                                          std::string debugName);

  [[nodiscard]] bool isValid() const noexcept {
    return source != nullptr && source[0] != '\0';
  }
};

/**
 * @brief Represents an individual shader, such as a vertex shader or fragment shader.
 */
class IShaderModule {
 protected:
  explicit IShaderModule(ShaderModuleInfo info);

 public:
  virtual ~IShaderModule() = default;

  /** @brief Returns metadata about the shader module */
  [[nodiscard]] const ShaderModuleInfo& info() const noexcept;

 private:
  const ShaderModuleInfo info_;
};

/**
 * @brief The set of shader modules used to create a IShaderStages object.
 * @see mipgen::IDevice::createShaderStages
 */
struct ShaderStagesDesc {
  /**
   * @brief Constructs a ShaderStagesDesc for render shader stages.
   * @param vertexModule The vertex shader module.
   * @param fragmentModule The fragment shader module.
   */
  static ShaderStagesDesc fromRenderModules(std::shared_ptr<IShaderModule> vertexModule,
                                            std::shared_ptr<IShaderModule> fragmentModule);

  /** @brief The vertex shader module to be used in a render pipeline state. */
  std::shared_ptr<IShaderModule> vertexModule;
  /** @brief The fragment shader module to be used in a render pipeline state. */
  std::shared_ptr<IShaderModule> fragmentModule;

  /** @brief Identifier used for debugging */
  std::string debugName;
};

/**
 * @brief A set of shader modules used to configure a render pipeline state.
 */
class IShaderStages {
 protected:
  explicit IShaderStages(ShaderStagesDesc desc);

 public:
  virtual ~IShaderStages() = default;

  [[nodiscard]] const std::shared_ptr<IShaderModule>& getVertexModule() const noexcept;
  [[nodiscard]] const std::shared_ptr<IShaderModule>& getFragmentModule() const noexcept;

  /**
   * @brief Checks if the IShaderStages object has both a vertex and a fragment module.
   */
  [[nodiscard]] bool isValid() const noexcept;

  [[nodiscard]] const std::string& getDebugName() const noexcept {
    return desc_.debugName;
  }

 private:
  ShaderStagesDesc desc_;
};
} // namespace mipgen
