/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/opengl/egl/Surface.h>

#include <mipgen/opengl/Framebuffer.h>

namespace mipgen::opengl::egl {

Surface::Surface(Context& context, EGLNativeWindowType window) :
  WithContext(context),
  window_(window),
  framebuffer_(std::make_shared<CurrentFramebuffer>(context)) {}

Surface::~Surface() {
  framebuffer_ = nullptr;
  getEGLContext().destroyWindowSurface(surface_);
}

Context& Surface::getEGLContext() const {
  return static_cast<Context&>(getContext());
}

TextureFormat Surface::getPreferredFormat() const {
  return TextureFormat::RGBA_UNorm8;
}

Result Surface::configure(const SurfaceConfig& config) {
  if (config.format != getPreferredFormat()) {
    return Result(Result::Code::UnsupportedFormat, "EGL surfaces are RGBA_UNorm8");
  }
  if (config.width == 0 || config.height == 0) {
    return Result(Result::Code::ArgumentInvalid, "Surface size must be at least 1x1");
  }

  auto& context = getEGLContext();
  const bool premultiplied = config.alphaMode == AlphaMode::Premultiplied;
  if (premultiplied && !context.supportsPremultipliedSurfaces()) {
    return Result(Result::Code::Unsupported,
                  "EGL config has no EGL_ALPHA_FORMAT_PRE window surfaces");
  }

  if (surface_ == EGL_NO_SURFACE || premultiplied != surfacePremultiplied_) {
    context.destroyWindowSurface(surface_);
    Result result;
    surface_ = context.createWindowSurface(window_, premultiplied, &result);
    if (!result.isOk()) {
      return result;
    }
    surfacePremultiplied_ = premultiplied;
  }

  auto result = context.setDrawSurface(surface_);
  if (!result.isOk()) {
    return result;
  }

  config_ = config;
  framebuffer_->setSize(config.width, config.height);
  return Result();
}

const SurfaceConfig& Surface::getConfig() const {
  return config_;
}

std::shared_ptr<IFramebuffer> Surface::getCurrentFramebuffer() {
  return surface_ == EGL_NO_SURFACE ? nullptr : framebuffer_;
}

Result Surface::present() {
  if (surface_ == EGL_NO_SURFACE) {
    return Result(Result::Code::InvalidOperation, "Surface is not configured");
  }
  return getEGLContext().swapBuffers(surface_);
}

} // namespace mipgen::opengl::egl
