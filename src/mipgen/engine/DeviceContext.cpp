/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/engine/DeviceContext.h>

#include <algorithm>
#include <mipgen/Format.h>

namespace mipgen::engine {

namespace {

const char* hwDeviceTypeToString(HWDeviceType type) {
  switch (type) {
  case HWDeviceType::Unknown:
    return "Unknown";
  case HWDeviceType::DiscreteGpu:
    return "DiscreteGpu";
  case HWDeviceType::ExternalGpu:
    return "ExternalGpu";
  case HWDeviceType::IntegratedGpu:
    return "IntegratedGpu";
  case HWDeviceType::SoftwareGpu:
    return "SoftwareGpu";
  }
  MIPGEN_UNREACHABLE_RETURN("Unknown")
}

} // namespace

DeviceContext::DeviceContext(DeviceContextDesc desc, std::unique_ptr<IHWDeviceProvider> provider) :
  desc_(std::move(desc)), provider_(std::move(provider)) {}

DeviceContext::~DeviceContext() = default;

bool DeviceContext::init(Result* outResult) {
  if (ready()) {
    Result::setOk(outResult);
    return true;
  }

  if (!MIPGEN_DEBUG_VERIFY(provider_)) {
    Result::setResult(outResult, Result::Code::ArgumentNull, "No device provider");
    return false;
  }

  Result result;
  auto adapters =
      provider_->queryDevices(HWDeviceQueryDesc(desc_.preferredType, desc_.queryFlags), &result);
  if (!result.isOk() || adapters.empty()) {
    MIPGEN_LOG_ERROR("[%s] No graphics adapter found. %s\n",
                     desc_.label.c_str(),
                     result.message.c_str());
    Result::setResult(outResult,
                      Result::Code::NoAdapter,
                      MIPGEN_FORMAT("{}: no graphics adapter found", desc_.label));
    return false;
  }

  auto it = std::find_if(adapters.begin(), adapters.end(), [this](const HWDeviceDesc& a) {
    return a.type == desc_.preferredType;
  });
  const HWDeviceDesc& adapter = it != adapters.end() ? *it : adapters.front();

  auto device = provider_->create(adapter, &result);
  if (!result.isOk() || !device) {
    MIPGEN_LOG_ERROR("[%s] Failed to create a device on '%s': %s\n",
                     desc_.label.c_str(),
                     adapter.name.c_str(),
                     result.message.c_str());
    Result::setResult(outResult,
                      Result::Code::NoDevice,
                      MIPGEN_FORMAT("{}: device creation failed: {}", desc_.label, result.message));
    return false;
  }

  auto commandQueue = device->createCommandQueue(CommandQueueDesc{}, &result);
  if (!result.isOk() || !commandQueue) {
    Result::setResult(outResult,
                      Result::Code::NoDevice,
                      MIPGEN_FORMAT("{}: command queue creation failed: {}",
                                    desc_.label,
                                    result.message));
    return false;
  }

  DeviceLimits limits;
  if (!device->getFeatureLimits(DeviceFeatureLimits::MaxTextureDimension1D2D,
                                limits.maxTextureDimension2D)) {
    MIPGEN_LOG_WARNING("[%s] Max texture dimension unknown\n", desc_.label.c_str());
  }

  MIPGEN_LOG_INFO("[%s] Using adapter '%s' (%s, %s), max texture size %zu\n",
                  desc_.label.c_str(),
                  adapter.name.c_str(),
                  adapter.vendor.c_str(),
                  hwDeviceTypeToString(adapter.type),
                  limits.maxTextureDimension2D);

  state_ = Ready{adapter, std::move(device), std::move(commandQueue), limits};
  Result::setOk(outResult);
  return true;
}

bool DeviceContext::ready() const noexcept {
  return std::holds_alternative<Ready>(state_);
}

const DeviceContext::Ready* DeviceContext::getReady(Result* outResult) const {
  const auto* ready = std::get_if<Ready>(&state_);
  if (ready == nullptr) {
    Result::setResult(outResult,
                      Result::Code::NotInitialized,
                      MIPGEN_FORMAT("{}: device context is not initialized", desc_.label));
    return nullptr;
  }
  Result::setOk(outResult);
  return ready;
}

const HWDeviceDesc* DeviceContext::adapter(Result* outResult) const {
  const auto* ready = getReady(outResult);
  return ready ? &ready->adapter : nullptr;
}

IDevice* DeviceContext::device(Result* outResult) const {
  const auto* ready = getReady(outResult);
  return ready ? ready->device.get() : nullptr;
}

std::shared_ptr<ICommandQueue> DeviceContext::commandQueue(Result* outResult) const {
  const auto* ready = getReady(outResult);
  return ready ? ready->commandQueue : nullptr;
}

DeviceLimits DeviceContext::limits(Result* outResult) const {
  const auto* ready = getReady(outResult);
  return ready ? ready->limits : DeviceLimits{};
}

} // namespace mipgen::engine
