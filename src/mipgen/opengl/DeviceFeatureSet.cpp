/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/opengl/DeviceFeatureSet.h>

#include <cstdio>
#include <mipgen/opengl/IContext.h>

namespace mipgen::opengl {

DeviceFeatureSet::DeviceFeatureSet(IContext& glContext) : glContext_(glContext) {}

void DeviceFeatureSet::initialize() {
  const char* versionString = reinterpret_cast<const char*>(glContext_.getString(GL_VERSION));
  if (versionString == nullptr ||
      sscanf(versionString, "OpenGL ES %d.%d", &version_.major, &version_.minor) != 2) {
    MIPGEN_LOG_ERROR("Unable to parse GL_VERSION: %s\n",
                     versionString != nullptr ? versionString : "(null)");
    version_ = GLVersion{};
  }

  supportedExtensions_.clear();
  GLint numExtensions = 0;
  glContext_.getIntegerv(GL_NUM_EXTENSIONS, &numExtensions);
  for (GLint i = 0; i < numExtensions; ++i) {
    const auto* name =
        reinterpret_cast<const char*>(glContext_.getStringi(GL_EXTENSIONS, static_cast<GLuint>(i)));
    if (name != nullptr) {
      supportedExtensions_.emplace(name);
    }
  }
  MIPGEN_LOG_DEBUG(
      "GL ES %d.%d, %zu extensions\n", version_.major, version_.minor, supportedExtensions_.size());
}

GLVersion DeviceFeatureSet::getGLVersion() const noexcept {
  return version_;
}

bool DeviceFeatureSet::isSupported(const std::string& extensionName) const {
  return supportedExtensions_.count(extensionName) != 0;
}

bool DeviceFeatureSet::hasExtension(Extensions extension) const {
  switch (extension) {
  case Extensions::ColorBufferFloat:
    return isSupported("GL_EXT_color_buffer_float");
  case Extensions::ColorBufferHalfFloat:
    return isSupported("GL_EXT_color_buffer_half_float") ||
           isSupported("GL_EXT_color_buffer_float");
  case Extensions::Debug:
    return isSupported("GL_KHR_debug");
  case Extensions::TextureFloatLinear:
    return isSupported("GL_OES_texture_float_linear");
  case Extensions::TextureFormatBgra8888:
    return isSupported("GL_EXT_texture_format_BGRA8888");
  }
  MIPGEN_UNREACHABLE_RETURN(false)
}

bool DeviceFeatureSet::hasFeature(DeviceFeatures feature) const {
  switch (feature) {
  case DeviceFeatures::PremultipliedAlphaSurface:
    return glContext_.supportsPremultipliedSurfaces();
  }
  MIPGEN_UNREACHABLE_RETURN(false)
}

bool DeviceFeatureSet::getFeatureLimits(DeviceFeatureLimits featureLimits, size_t& result) const {
  GLint tsize = 0;
  switch (featureLimits) {
  case DeviceFeatureLimits::MaxTextureDimension1D2D:
    glContext_.getIntegerv(GL_MAX_TEXTURE_SIZE, &tsize);
    result = (size_t)tsize;
    return true;

  case DeviceFeatureLimits::MaxTextureSamplers:
    glContext_.getIntegerv(GL_MAX_TEXTURE_IMAGE_UNITS, &tsize);
    result = (size_t)tsize;
    return true;
  }
  result = 0;
  return false;
}

ICapabilities::TextureFormatCapabilities DeviceFeatureSet::getTextureFormatCapabilities(
    TextureFormat format) const {
  const auto sampled = ICapabilities::TextureFormatCapabilityBits::Sampled;
  const auto sampledFiltered = ICapabilities::TextureFormatCapabilityBits::SampledFiltered;
  const auto attachment = ICapabilities::TextureFormatCapabilityBits::Attachment;

  ICapabilities::TextureFormatCapabilities capabilities = 0;

  // Table 3.13 of the OpenGL ES 3.0.6 specification
  switch (format) {
  case TextureFormat::Invalid:
    return ICapabilities::TextureFormatCapabilityBits::Unsupported;

  case TextureFormat::A_UNorm8:
  case TextureFormat::L_UNorm8:
  case TextureFormat::LA_UNorm8:
    // unsized formats are texturable but never color-renderable
    capabilities |= sampled | sampledFiltered;
    break;

  case TextureFormat::R_UNorm8:
  case TextureFormat::RG_UNorm8:
  case TextureFormat::RGBA_UNorm8:
  case TextureFormat::RGBA_SRGB:
  case TextureFormat::RGB10_A2_UNorm_Rev:
    capabilities |= sampled | sampledFiltered | attachment;
    break;

  case TextureFormat::BGRA_UNorm8:
    if (hasExtension(Extensions::TextureFormatBgra8888)) {
      capabilities |= sampled | sampledFiltered | attachment;
    }
    break;

  case TextureFormat::BGRA_SRGB:
    break;

  case TextureFormat::R_F16:
  case TextureFormat::RG_F16:
  case TextureFormat::RGBA_F16:
    capabilities |= sampled | sampledFiltered;
    if (hasExtension(Extensions::ColorBufferHalfFloat)) {
      capabilities |= attachment;
    }
    break;

  case TextureFormat::R_F32:
  case TextureFormat::RG_F32:
  case TextureFormat::RGBA_F32:
    capabilities |= sampled;
    if (hasExtension(Extensions::TextureFloatLinear)) {
      capabilities |= sampledFiltered;
    }
    if (hasExtension(Extensions::ColorBufferFloat)) {
      capabilities |= attachment;
    }
    break;

  case TextureFormat::R_UInt16:
  case TextureFormat::RG_UInt16:
  case TextureFormat::RGBA_UInt32:
    capabilities |= sampled | attachment;
    break;

  case TextureFormat::Z_UNorm16:
  case TextureFormat::Z_UNorm24:
  case TextureFormat::S8_UInt_Z24_UNorm:
    capabilities |= sampled | attachment;
    break;

  case TextureFormat::S_UInt8:
    // stencil-only textures need ES 3.1
    break;
  }

  return capabilities;
}

} // namespace mipgen::opengl
