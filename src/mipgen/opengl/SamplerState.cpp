/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/opengl/SamplerState.h>

#include <mipgen/opengl/IContext.h>

namespace mipgen::opengl {

SamplerState::SamplerState(IContext& context, const SamplerStateDesc& desc) :
  WithContext(context), desc_(desc) {}

SamplerState::~SamplerState() {
  if (samplerID_ != 0) {
    getContext().deleteSamplers(1, &samplerID_);
  }
}

Result SamplerState::create() {
  auto& ctx = getContext();
  ctx.genSamplers(1, &samplerID_);
  if (samplerID_ == 0) {
    return Result(Result::Code::RuntimeError, "Failed to create GL sampler");
  }

  ctx.samplerParameteri(
      samplerID_, GL_TEXTURE_MIN_FILTER, convertMinMipFilter(desc_.minFilter, desc_.mipFilter));
  ctx.samplerParameteri(samplerID_, GL_TEXTURE_MAG_FILTER, convertMagFilter(desc_.magFilter));
  ctx.samplerParameteri(samplerID_, GL_TEXTURE_WRAP_S, convertAddressMode(desc_.addressModeU));
  ctx.samplerParameteri(samplerID_, GL_TEXTURE_WRAP_T, convertAddressMode(desc_.addressModeV));
  ctx.samplerParameterf(samplerID_, GL_TEXTURE_MIN_LOD, static_cast<GLfloat>(desc_.mipLodMin));
  ctx.samplerParameterf(samplerID_, GL_TEXTURE_MAX_LOD, static_cast<GLfloat>(desc_.mipLodMax));
  ctx.objectLabel(GL_SAMPLER_KHR, samplerID_, desc_.debugName);

  return ctx.checkForErrors("SamplerState::create");
}

void SamplerState::bind(size_t unit) {
  getContext().bindSampler(static_cast<GLuint>(unit), samplerID_);
}

void SamplerState::unbind(size_t unit) {
  getContext().bindSampler(static_cast<GLuint>(unit), 0);
}

GLint SamplerState::convertMinMipFilter(SamplerMinMagFilter minFilter, SamplerMipFilter mipFilter) {
  switch (mipFilter) {
  case SamplerMipFilter::Disabled:
    return (minFilter == SamplerMinMagFilter::Nearest) ? GL_NEAREST : GL_LINEAR;
  case SamplerMipFilter::Nearest:
    return (minFilter == SamplerMinMagFilter::Nearest) ? GL_NEAREST_MIPMAP_NEAREST
                                                       : GL_LINEAR_MIPMAP_NEAREST;
  case SamplerMipFilter::Linear:
    return (minFilter == SamplerMinMagFilter::Nearest) ? GL_NEAREST_MIPMAP_LINEAR
                                                       : GL_LINEAR_MIPMAP_LINEAR;
  }
  MIPGEN_UNREACHABLE_RETURN(GL_NEAREST)
}

GLint SamplerState::convertMagFilter(SamplerMinMagFilter magFilter) {
  return (magFilter == SamplerMinMagFilter::Nearest) ? GL_NEAREST : GL_LINEAR;
}

GLint SamplerState::convertAddressMode(SamplerAddressMode addressMode) {
  switch (addressMode) {
  case SamplerAddressMode::Repeat:
    return GL_REPEAT;
  case SamplerAddressMode::Clamp:
    return GL_CLAMP_TO_EDGE;
  case SamplerAddressMode::MirrorRepeat:
    return GL_MIRRORED_REPEAT;
  }
  MIPGEN_UNREACHABLE_RETURN(GL_REPEAT)
}

} // namespace mipgen::opengl
