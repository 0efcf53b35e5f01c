/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/HWDevice.h>

namespace mipgen::opengl::egl {

class Context;

/**
 * @brief Device provider for the default EGL display. The display is reported as a single
 * adapter named after its GL renderer.
 */
class HWDevice final : public IHWDeviceProvider {
 public:
  std::vector<HWDeviceDesc> queryDevices(const HWDeviceQueryDesc& desc,
                                         Result* MIPGEN_NULLABLE outResult) override;
  std::unique_ptr<IDevice> create(const HWDeviceDesc& desc,
                                  Result* MIPGEN_NULLABLE outResult) override;

  /**
   * @brief Creates an offscreen context suitable for unit testing.
   */
  std::unique_ptr<Context> createOffscreenContext(size_t width,
                                                  size_t height,
                                                  Result* MIPGEN_NULLABLE outResult) const;
};

} // namespace mipgen::opengl::egl
