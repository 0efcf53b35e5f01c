/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/Common.h>
#include <mipgen/TextureFormat.h>

namespace mipgen {

class IFramebuffer;

/**
 * @brief How the compositor interprets the alpha channel of presented images.
 */
enum class AlphaMode : uint8_t {
  Opaque,
  Premultiplied,
};

struct SurfaceConfig {
  TextureFormat format = TextureFormat::Invalid;
  uint32_t width = 1;
  uint32_t height = 1;
  AlphaMode alphaMode = AlphaMode::Premultiplied;

  bool operator==(const SurfaceConfig& other) const {
    return format == other.format && width == other.width && height == other.height &&
           alphaMode == other.alphaMode;
  }
  bool operator!=(const SurfaceConfig& other) const {
    return !(*this == other);
  }
};

/**
 * @brief A presentable target bound to one window and one device.
 */
class ISurface {
 public:
  virtual ~ISurface() = default;

  /** @brief Format the platform prefers for this surface's back buffers. */
  [[nodiscard]] virtual TextureFormat getPreferredFormat() const = 0;

  /**
   * @brief (Re)configures the back buffers. `config.format` must be the preferred format.
   */
  virtual Result configure(const SurfaceConfig& config) = 0;
  [[nodiscard]] virtual const SurfaceConfig& getConfig() const = 0;

  /** @brief Framebuffer rendering into the current back buffer. */
  [[nodiscard]] virtual std::shared_ptr<IFramebuffer> getCurrentFramebuffer() = 0;

  virtual Result present() = 0;
};

} // namespace mipgen
