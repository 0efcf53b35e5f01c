/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <mipgen/Device.h>
#include <mipgen/HWDevice.h>
#include <string>
#include <variant>

namespace mipgen::engine {

struct DeviceContextDesc {
  /// Prefix of every debug name and log line emitted on behalf of this context.
  std::string label = "untitled";
  /// Adapter type picked first when several are reported. Any adapter is accepted otherwise.
  HWDeviceType preferredType = HWDeviceType::Unknown;
  /// Passed through to IHWDeviceProvider::queryDevices.
  uint32_t queryFlags = 0;
};

struct DeviceLimits {
  size_t maxTextureDimension2D = 0;
};

///--------------------------------------
/// MARK: - DeviceContext

/// Owns the adapter, the logical device and the device's command queue. Every other engine
/// object borrows the device from here, so it must outlive them.
class DeviceContext final {
 public:
  DeviceContext(DeviceContextDesc desc, std::unique_ptr<IHWDeviceProvider> provider);
  ~DeviceContext();

  DeviceContext(const DeviceContext&) = delete;
  DeviceContext& operator=(const DeviceContext&) = delete;

  /// Acquires an adapter and creates the device. Calling it again once ready is a no-op.
  bool init(Result* MIPGEN_NULLABLE outResult = nullptr);

  [[nodiscard]] bool ready() const noexcept;

  [[nodiscard]] const HWDeviceDesc* MIPGEN_NULLABLE
  adapter(Result* MIPGEN_NULLABLE outResult = nullptr) const;
  [[nodiscard]] IDevice* MIPGEN_NULLABLE device(Result* MIPGEN_NULLABLE outResult = nullptr) const;
  [[nodiscard]] std::shared_ptr<ICommandQueue> commandQueue(
      Result* MIPGEN_NULLABLE outResult = nullptr) const;
  [[nodiscard]] DeviceLimits limits(Result* MIPGEN_NULLABLE outResult = nullptr) const;

  [[nodiscard]] const std::string& label() const noexcept {
    return desc_.label;
  }

 private:
  struct Uninitialized {};
  struct Ready {
    HWDeviceDesc adapter;
    // Declared before the queue so the queue is released first.
    std::unique_ptr<IDevice> device;
    std::shared_ptr<ICommandQueue> commandQueue;
    DeviceLimits limits;
  };

  [[nodiscard]] const Ready* MIPGEN_NULLABLE getReady(Result* MIPGEN_NULLABLE outResult) const;

  const DeviceContextDesc desc_;
  std::unique_ptr<IHWDeviceProvider> provider_;
  std::variant<Uninitialized, Ready> state_;
};

} // namespace mipgen::engine
