/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/opengl/egl/Device.h>

#include <mipgen/opengl/egl/Context.h>
#include <mipgen/opengl/egl/Surface.h>

namespace mipgen::opengl::egl {

Device::Device(std::unique_ptr<Context> context) : opengl::Device(std::move(context)) {}

Context& Device::getEGLContext() const {
  return static_cast<Context&>(getContext());
}

std::shared_ptr<ISurface> Device::createSurface(IWindow& window, Result* outResult) {
  if (window.getNativeWindow() == 0) {
    Result::setResult(outResult, Result::Code::ArgumentNull, "Window has no native handle");
    return nullptr;
  }
  Result::setOk(outResult);
  // NOLINTNEXTLINE(performance-no-int-to-ptr)
  return std::make_shared<Surface>(getEGLContext(), (EGLNativeWindowType)window.getNativeWindow());
}

} // namespace mipgen::opengl::egl
