/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "TestDevice.h"

#include <mipgen/Config.h>
#if MIPGEN_BACKEND_OPENGL
#include <mipgen/opengl/egl/HWDevice.h>
#endif

namespace mipgen::tests::util {

std::shared_ptr<::mipgen::IDevice> createTestDevice() {
#if MIPGEN_BACKEND_OPENGL
  opengl::egl::HWDevice hwDevice;
  Result result;
  auto adapters = hwDevice.queryDevices(HWDeviceQueryDesc(HWDeviceType::Unknown), &result);
  if (!result.isOk() || adapters.empty()) {
    return nullptr;
  }
  std::shared_ptr<IDevice> device = hwDevice.create(adapters.front(), &result);
  return result.isOk() ? device : nullptr;
#else
  return nullptr;
#endif
}

std::unique_ptr<::mipgen::engine::DeviceContext> createTestDeviceContext(const char* label) {
#if MIPGEN_BACKEND_OPENGL
  engine::DeviceContextDesc desc;
  desc.label = label;
  auto context = std::make_unique<engine::DeviceContext>(
      desc, std::make_unique<opengl::egl::HWDevice>());
  Result result;
  if (!context->init(&result)) {
    return nullptr;
  }
  return context;
#else
  (void)label;
  return nullptr;
#endif
}

} // namespace mipgen::tests::util
