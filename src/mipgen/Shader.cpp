/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/Shader.h>

namespace mipgen {

bool ShaderModuleInfo::operator==(const ShaderModuleInfo& other) const {
  return stage == other.stage && entryPoint == other.entryPoint;
}

bool ShaderModuleInfo::operator!=(const ShaderModuleInfo& other) const {
  return !operator==(other);
}

ShaderModuleDesc ShaderModuleDesc::fromStringInput(const char* MIPGEN_NONNULL source,
                                                   ShaderModuleInfo info,
                                                   std::string debugName) {
  ShaderModuleDesc desc;
  desc.source = source;
  desc.info = std::move(info);
  desc.debugName = std::move(debugName);
  return desc;
}

IShaderModule::IShaderModule(ShaderModuleInfo info) : info_(std::move(info)) {}

const ShaderModuleInfo& IShaderModule::info() const noexcept {
  return info_;
}

ShaderStagesDesc ShaderStagesDesc::fromRenderModules(
    std::shared_ptr<IShaderModule> vertexModule,
    std::shared_ptr<IShaderModule> fragmentModule) {
  ShaderStagesDesc desc;
  desc.vertexModule = std::move(vertexModule);
  desc.fragmentModule = std::move(fragmentModule);
  return desc;
}

IShaderStages::IShaderStages(ShaderStagesDesc desc) : desc_(std::move(desc)) {}

const std::shared_ptr<IShaderModule>& IShaderStages::getVertexModule() const noexcept {
  return desc_.vertexModule;
}

const std::shared_ptr<IShaderModule>& IShaderStages::getFragmentModule() const noexcept {
  return desc_.fragmentModule;
}

bool IShaderStages::isValid() const noexcept {
  return desc_.vertexModule && desc_.fragmentModule &&
         desc_.vertexModule->info().stage == ShaderStage::Vertex &&
         desc_.fragmentModule->info().stage == ShaderStage::Fragment;
}

} // namespace mipgen
