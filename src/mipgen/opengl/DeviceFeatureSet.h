/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/DeviceFeatures.h>
#include <mipgen/opengl/GLIncludes.h>
#include <string>
#include <unordered_set>

namespace mipgen::opengl {

class IContext;

/**
 * @brief GL extensions whose presence changes behavior.
 */
enum class Extensions {
  ColorBufferFloat = 0, // GL_EXT_color_buffer_float
  ColorBufferHalfFloat, // GL_EXT_color_buffer_half_float
  Debug, // GL_KHR_debug
  TextureFloatLinear, // GL_OES_texture_float_linear
  TextureFormatBgra8888, // GL_EXT_texture_format_BGRA8888
};

struct GLVersion {
  int major = 0;
  int minor = 0;
};

class DeviceFeatureSet final {
 public:
  explicit DeviceFeatureSet(IContext& glContext);

  /**
   * @brief Reads the version and extension list of the current context.
   */
  void initialize();

  [[nodiscard]] GLVersion getGLVersion() const noexcept;

  [[nodiscard]] bool isSupported(const std::string& extensionName) const;
  [[nodiscard]] bool hasExtension(Extensions extension) const;
  [[nodiscard]] bool hasFeature(DeviceFeatures feature) const;

  bool getFeatureLimits(DeviceFeatureLimits featureLimits, size_t& result) const;

  [[nodiscard]] ICapabilities::TextureFormatCapabilities getTextureFormatCapabilities(
      TextureFormat format) const;

 private:
  IContext& glContext_;
  GLVersion version_;
  std::unordered_set<std::string> supportedExtensions_;
};

} // namespace mipgen::opengl
