/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/Common.h>
#include <mipgen/Texture.h>
#include <vector>

namespace mipgen {

class ICommandQueue;

/**
 * @brief Represents textures associated with the frame buffer. The mip level that is rendered to
 * is chosen per render pass (RenderPassDesc::AttachmentDesc::mipLevel).
 */
struct FramebufferDesc {
  struct AttachmentDesc {
    std::shared_ptr<ITexture> texture;
  };

  /** @brief All color attachments */
  AttachmentDesc colorAttachments[MIPGEN_COLOR_ATTACHMENTS_MAX] = {};

  std::string debugName;
};

/**
 * @brief Interface common to all frame buffers across all implementations
 */
class IFramebuffer {
 public:
  virtual ~IFramebuffer() = default;

  // Accessors
  /** @brief Retrieve array of all valid color attachment indices */
  [[nodiscard]] virtual std::vector<size_t> getColorAttachmentIndices() const = 0;
  /** @brief Retrieve a specific color attachment by index */
  [[nodiscard]] virtual std::shared_ptr<ITexture> getColorAttachment(size_t index) const = 0;

  // Methods
  /** @brief Copy color data from the color attachment at the specified index into 'pixelBytes'.
   * `range.mipLevel` selects the level that is read. Some implementations may only support index
   * 0. If bytesPerRow is 0, it will be autocalculated assuming no padding. */
  virtual void copyBytesColorAttachment(ICommandQueue& cmdQueue,
                                        size_t index,
                                        void* MIPGEN_NONNULL pixelBytes,
                                        const TextureRangeDesc& range,
                                        size_t bytesPerRow = 0) const = 0;
};

} // namespace mipgen
