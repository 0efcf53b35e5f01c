/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/Common.h>
#include <utility>
#include <vector>

namespace mipgen {

class IDevice;

/**
 * @brief Represents a type of a physical device for graphics purposes
 */
enum class HWDeviceType {
  /// Unknown
  Unknown = 0,
  /// HW GPU - Discrete
  DiscreteGpu = 1,
  /// HW GPU - External
  ExternalGpu = 2,
  /// HW GPU - Integrated
  IntegratedGpu = 3,
  /// SW GPU
  SoftwareGpu = 4,
};

/**
 * @brief Represents a query of a physical device to be requested from the underlying
 * implementation
 */
struct HWDeviceQueryDesc {
  /** @brief Desired hardware type */
  HWDeviceType hardwareType;
  /** @brief Reserved */
  uint32_t flags;

  explicit HWDeviceQueryDesc(HWDeviceType hardwareType, uint32_t flags = 0L) :
    hardwareType(hardwareType), flags(flags) {}
};

/**
 * @brief  Represents a description of a specific physical device installed in the system
 */
struct HWDeviceDesc {
  /** @brief Implementation-specific identifier of a device */
  uintptr_t guid;
  /** @brief A type of an actual physical device */
  HWDeviceType type;
  /** @brief Implementation-specific name of a device */
  std::string name;
  /** @brief Implementation-specific vendor name */
  std::string vendor;
  /** @brief Unique identifier of a vendor */
  uint32_t vendorId;

  HWDeviceDesc(uintptr_t guid,
               HWDeviceType type,
               uint32_t vendorId = 0,
               std::string name = "",
               std::string vendor = "") :
    guid(guid), type(type), name(std::move(name)), vendor(std::move(vendor)), vendorId(vendorId) {}
};

/**
 * @brief Enumerates physical adapters and creates logical devices from them.
 */
class IHWDeviceProvider {
 public:
  virtual ~IHWDeviceProvider() = default;

  /**
   * @brief Returns the adapters visible to this provider. An empty list is not an error.
   */
  virtual std::vector<HWDeviceDesc> queryDevices(const HWDeviceQueryDesc& desc,
                                                 Result* MIPGEN_NULLABLE outResult) = 0;

  /**
   * @brief Creates a device for one of the adapters returned by queryDevices().
   */
  virtual std::unique_ptr<IDevice> create(const HWDeviceDesc& desc,
                                          Result* MIPGEN_NULLABLE outResult) = 0;
};

} // namespace mipgen
