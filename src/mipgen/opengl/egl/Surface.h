/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/Surface.h>
#include <mipgen/Window.h>
#include <mipgen/opengl/WithContext.h>
#include <mipgen/opengl/egl/Context.h>

namespace mipgen::opengl {
class CurrentFramebuffer;
} // namespace mipgen::opengl

namespace mipgen::opengl::egl {

/**
 * @brief EGL window surface. The EGL surface is created by the first configure() and recreated
 * only when the alpha mode changes; EGL tracks the window's size on its own.
 */
class Surface final : public WithContext, public ISurface {
 public:
  Surface(Context& context, EGLNativeWindowType window);
  ~Surface() override;

  [[nodiscard]] TextureFormat getPreferredFormat() const override;
  Result configure(const SurfaceConfig& config) override;
  [[nodiscard]] const SurfaceConfig& getConfig() const override;
  [[nodiscard]] std::shared_ptr<IFramebuffer> getCurrentFramebuffer() override;
  Result present() override;

 private:
  [[nodiscard]] Context& getEGLContext() const;

  EGLNativeWindowType window_;
  EGLSurface surface_ = EGL_NO_SURFACE;
  bool surfacePremultiplied_ = false;
  SurfaceConfig config_;
  std::shared_ptr<CurrentFramebuffer> framebuffer_;
};

} // namespace mipgen::opengl::egl
