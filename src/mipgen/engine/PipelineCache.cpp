/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/engine/PipelineCache.h>

#include <mipgen/Format.h>

namespace mipgen::engine {

PipelineCache::PipelineCache(DeviceContext& context) : context_(context) {}

bool PipelineCache::isFormatSupported(const ICapabilities& capabilities, TextureFormat format) {
  const auto properties = TextureFormatProperties::fromTextureFormat(format);
  if (!properties.isValid() || !properties.hasColor() || properties.isInteger()) {
    return false;
  }
  const auto caps = capabilities.getTextureFormatCapabilities(format);
  return ::mipgen::contains(caps, ICapabilities::TextureFormatCapabilityBits::SampledFiltered) &&
         ::mipgen::contains(caps, ICapabilities::TextureFormatCapabilityBits::Attachment);
}

std::shared_ptr<ShaderProgram> PipelineCache::getProgram(TextureFormat format,
                                                        Result* outResult) {
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    auto it = programs_.find(format);
    if (it != programs_.end()) {
      Result::setOk(outResult);
      return it->second;
    }
  }

  IDevice* device = context_.device(outResult);
  if (!device) {
    return nullptr;
  }

  const auto properties = TextureFormatProperties::fromTextureFormat(format);
  if (!isFormatSupported(*device, format)) {
    MIPGEN_LOG_ERROR("[%s] No mipmap pipeline for format %s\n",
                     context_.label().c_str(),
                     properties.name);
    Result::setResult(outResult,
                      Result::Code::UnsupportedFormat,
                      MIPGEN_FORMAT("Format {} cannot be sampled with filtering and rendered to",
                                    properties.name));
    return nullptr;
  }

  // Compiled outside the lock so a slow driver does not stall lookups of other formats.
  Result result;
  std::shared_ptr<ShaderProgram> program =
      ShaderProgram::create(*device, format, context_.label() + "/", &result);
  if (!result.isOk() || !program) {
    MIPGEN_LOG_ERROR("[%s] Failed to build the mipmap pipeline for %s: %s\n",
                     context_.label().c_str(),
                     properties.name,
                     result.message.c_str());
    Result::setResult(outResult, std::move(result));
    return nullptr;
  }

  const std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = programs_.emplace(format, std::move(program));
  if (inserted) {
    MIPGEN_LOG_DEBUG(
        "[%s] Built mipmap pipeline for %s\n", context_.label().c_str(), properties.name);
  }
  Result::setOk(outResult);
  return it->second;
}

bool PipelineCache::contains(TextureFormat format) const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return programs_.find(format) != programs_.end();
}

size_t PipelineCache::size() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return programs_.size();
}

} // namespace mipgen::engine
