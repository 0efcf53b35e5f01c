/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <mipgen/engine/DeviceContext.h>
#include <mipgen/engine/MipGenerator.h>

namespace mipgen::engine {

/// Decoded pixels owned by the caller. Only needs to stay valid during createTexture().
struct ImageSource {
  const void* MIPGEN_NULLABLE pixels = nullptr;
  uint32_t width = 0;
  uint32_t height = 0;
  /// 0 means tightly packed rows.
  size_t bytesPerRow = 0;
  /// Images arrive top row first; GL samples bottom row first.
  bool flipY = true;
};

struct TextureSpec {
  TextureFormat format = TextureFormat::RGBA_UNorm8;
  ImageSource image;
  bool generateMipmaps = true;
  std::string debugName;
};

/// Completion token for GPU work a call submitted but did not wait for. A default-constructed
/// token stands for "nothing submitted" and is always complete.
class PendingSubmission final {
 public:
  PendingSubmission() = default;
  PendingSubmission(std::shared_ptr<ICommandBuffer> commandBuffer, SubmitHandle handle) :
    commandBuffer_(std::move(commandBuffer)), handle_(handle) {}

  [[nodiscard]] bool isComplete() const {
    return !commandBuffer_ || commandBuffer_->isCompleted();
  }
  void wait() const {
    if (commandBuffer_) {
      commandBuffer_->waitUntilCompleted();
    }
  }
  [[nodiscard]] SubmitHandle handle() const noexcept {
    return handle_;
  }

 private:
  std::shared_ptr<ICommandBuffer> commandBuffer_;
  SubmitHandle handle_ = 0;
};

struct CreatedTexture {
  std::shared_ptr<ITexture> texture;
  PendingSubmission pending;
  uint32_t generatedLevels = 0;
};

///--------------------------------------
/// MARK: - TextureFactory

/// Creates sampled textures from CPU images: allocates the full chain, uploads level 0 and queues
/// generation of the remaining levels without waiting for it.
class TextureFactory final {
 public:
  TextureFactory(DeviceContext& context, MipGenerator& mipGenerator);

  CreatedTexture createTexture(const TextureSpec& spec,
                               Result* MIPGEN_NULLABLE outResult = nullptr);

  static constexpr TextureDesc::TextureUsage kUsage = TextureDesc::TextureUsageBits::Sampled |
                                                      TextureDesc::TextureUsageBits::CopyDst |
                                                      TextureDesc::TextureUsageBits::Attachment;

 private:
  DeviceContext& context_;
  MipGenerator& mipGenerator_;
};

} // namespace mipgen::engine
