/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <mipgen/engine/DeviceContext.h>
#include <mipgen/engine/ShaderProgram.h>
#include <mutex>
#include <unordered_map>

namespace mipgen::engine {

///--------------------------------------
/// MARK: - PipelineCache

/// Lazily builds one downsampling ShaderProgram per color format and keeps it until the cache is
/// destroyed. Programs are never evicted.
class PipelineCache final {
 public:
  explicit PipelineCache(DeviceContext& context);

  /// Returns the program rendering into `format`, building it on first use. Two threads asking
  /// for the same uncached format may both compile; the first insert wins.
  std::shared_ptr<ShaderProgram> getProgram(TextureFormat format,
                                            Result* MIPGEN_NULLABLE outResult = nullptr);

  [[nodiscard]] bool contains(TextureFormat format) const;
  [[nodiscard]] size_t size() const;

  /// True if `capabilities` allow the downsampling pass to sample and render `format`.
  static bool isFormatSupported(const ICapabilities& capabilities, TextureFormat format);

 private:
  DeviceContext& context_;
  mutable std::mutex mutex_;
  std::unordered_map<TextureFormat, std::shared_ptr<ShaderProgram>> programs_;
};

} // namespace mipgen::engine
