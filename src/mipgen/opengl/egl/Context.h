/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <EGL/egl.h>
#include <EGL/eglext.h>
#include <EGL/eglplatform.h>
#include <memory>

#include <mipgen/opengl/IContext.h>

namespace mipgen::opengl::egl {

class Context final : public IContext {
 public:
  /// Creates an offscreen context on the default display with a `width` x `height` pbuffer as its
  /// draw surface. Returns null when no ES 3 context can be created.
  static std::unique_ptr<Context> createOffscreen(size_t width,
                                                  size_t height,
                                                  Result* MIPGEN_NULLABLE outResult);

  ~Context() override;

  void setCurrent() override;
  void clearCurrentContext() const override;
  [[nodiscard]] bool isCurrentContext() const override;
  void present() const override;
  [[nodiscard]] bool supportsPremultipliedSurfaces() const override;

  /// Creates a window surface with this context's config. `premultiplied` requests
  /// EGL_VG_ALPHA_FORMAT_PRE and is ignored when the config cannot provide it.
  EGLSurface createWindowSurface(EGLNativeWindowType window,
                                 bool premultiplied,
                                 Result* MIPGEN_NULLABLE outResult);
  void destroyWindowSurface(EGLSurface surface);

  /// Makes `surface` the draw and read surface. EGL_NO_SURFACE restores the pbuffer.
  Result setDrawSurface(EGLSurface surface);
  Result swapBuffers(EGLSurface surface) const;

  [[nodiscard]] EGLContext get() const;
  [[nodiscard]] EGLDisplay getDisplay() const;
  [[nodiscard]] EGLConfig getConfig() const;

 protected:
  [[nodiscard]] GLProc getProcAddress(const char* MIPGEN_NONNULL name) const override;

 private:
  Context(EGLDisplay display, EGLConfig config, EGLContext context, EGLSurface pbuffer);

  EGLDisplay display_ = EGL_NO_DISPLAY;
  EGLConfig config_ = nullptr;
  EGLContext context_ = EGL_NO_CONTEXT;
  EGLSurface pbufferSurface_ = EGL_NO_SURFACE;
  EGLSurface drawSurface_ = EGL_NO_SURFACE;
  bool supportsPremultiplied_ = false;
};

} // namespace mipgen::opengl::egl
