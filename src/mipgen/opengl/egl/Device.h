/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/opengl/Device.h>

namespace mipgen::opengl::egl {

class Context;

class Device final : public ::mipgen::opengl::Device {
 public:
  explicit Device(std::unique_ptr<Context> context);

  std::shared_ptr<ISurface> createSurface(IWindow& window,
                                          Result* MIPGEN_NULLABLE outResult) override;

  [[nodiscard]] Context& getEGLContext() const;
};

} // namespace mipgen::opengl::egl
