/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/Common.h>
#include <vector>

namespace mipgen {

/**
 * @brief LoadAction determines the loading time action of the color attachments of a
 * RenderPassDesc. This can be DontCare, Load, or Clear.
 *
 * DontCare : No specific operation required.
 * Load : Preserve previous render contents
 * Clear : Clear render contents
 */
enum class LoadAction : uint8_t {
  DontCare,
  Load,
  Clear,
};

/**
 * @brief StoreAction determines the resolution action of the color attachments of a
 * RenderPassDesc. This can be DontCare or Store.
 *
 * DontCare : No specific operation required.
 * Store : Preserve render contents
 */
enum class StoreAction : uint8_t {
  DontCare,
  Store,
};

/**
 * @brief RenderPassDesc describes the load/store behavior and the target mip level of each color
 * attachment of a framebuffer for the duration of one render pass.
 */
struct RenderPassDesc {
 public:
  struct AttachmentDesc {
    LoadAction loadAction = LoadAction::DontCare; // default load action for color
    StoreAction storeAction = StoreAction::Store; // default store action for color
    uint8_t mipLevel = 0; // Texture mip level
    Color clearColor = {0.0f, 0.0f, 0.0f, 0.0f};
  };

  /**
   * @brief colorAttachments properties which is empty by default.
   */
  std::vector<AttachmentDesc> colorAttachments;

  std::string debugName;
};

} // namespace mipgen
