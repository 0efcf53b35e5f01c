/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/opengl/egl/HWDevice.h>

#include <mipgen/opengl/egl/Context.h>
#include <mipgen/opengl/egl/Device.h>
#include <string>

namespace mipgen::opengl::egl {

namespace {

std::string glString(IContext& context, GLenum name) {
  const auto* str = context.getString(name);
  return str ? reinterpret_cast<const char*>(str) : "";
}

HWDeviceType deviceTypeFromRenderer(const std::string& renderer) {
  for (const char* software : {"llvmpipe", "softpipe", "SwiftShader", "lavapipe"}) {
    if (renderer.find(software) != std::string::npos) {
      return HWDeviceType::SoftwareGpu;
    }
  }
  return HWDeviceType::Unknown;
}

} // namespace

std::unique_ptr<Context> HWDevice::createOffscreenContext(size_t width,
                                                          size_t height,
                                                          Result* outResult) const {
  return Context::createOffscreen(width, height, outResult);
}

std::vector<HWDeviceDesc> HWDevice::queryDevices(const HWDeviceQueryDesc& /*desc*/,
                                                 Result* outResult) {
  Result result;
  auto scratchContext = createOffscreenContext(1, 1, &result);
  if (!scratchContext) {
    MIPGEN_LOG_INFO("No EGL adapter: %s\n", result.message.c_str());
    Result::setOk(outResult);
    return {};
  }

  const std::string renderer = glString(*scratchContext, GL_RENDERER);
  const std::string vendor = glString(*scratchContext, GL_VENDOR);

  std::vector<HWDeviceDesc> devices;
  devices.emplace_back(reinterpret_cast<uintptr_t>(scratchContext->getDisplay()),
                       deviceTypeFromRenderer(renderer),
                       0,
                       renderer,
                       vendor);
  Result::setOk(outResult);
  return devices;
}

std::unique_ptr<IDevice> HWDevice::create(const HWDeviceDesc& desc, Result* outResult) {
  auto context = createOffscreenContext(1, 1, outResult);
  if (!context) {
    return nullptr;
  }
  if (reinterpret_cast<uintptr_t>(context->getDisplay()) != desc.guid) {
    Result::setResult(outResult, Result::Code::ArgumentInvalid, "Unknown adapter " + desc.name);
    return nullptr;
  }
  Result::setOk(outResult);
  return std::make_unique<Device>(std::move(context));
}

} // namespace mipgen::opengl::egl
