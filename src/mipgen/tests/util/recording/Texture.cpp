/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Texture.h"

#include <algorithm>
#include <vector>

namespace mipgen::tests::util::recording {

Texture::Texture(const TextureDesc& desc, std::shared_ptr<Recording> recording) :
  ITexture(desc.format),
  recording_(std::move(recording)),
  width_(desc.width),
  height_(desc.height),
  usage_(desc.usage),
  numMipLevels_(desc.numMipLevels),
  debugName_(desc.debugName) {}

Texture::Texture(std::shared_ptr<Texture> parent, const TextureViewDesc& desc) :
  ITexture(parent->getFormat()),
  recording_(parent->recording_),
  width_(parent->getDimensions().atLevel(desc.mipLevel).width),
  height_(parent->getDimensions().atLevel(desc.mipLevel).height),
  usage_(parent->usage_ & ~TextureDesc::TextureUsageBits::CopyDst),
  baseMipLevel_(parent->baseMipLevel_ + desc.mipLevel),
  numMipLevels_(desc.numMipLevels),
  debugName_(desc.debugName) {
  parent_ = std::move(parent);
}

Dimensions Texture::getDimensions() const {
  return Dimensions{width_, height_};
}

TextureDesc::TextureUsage Texture::getUsage() const {
  return usage_;
}

const Texture& Texture::getRoot() const {
  return parent_ ? parent_->getRoot() : *this;
}

Result Texture::uploadInternal(const TextureRangeDesc& range,
                               const void* data,
                               size_t bytesPerRow) const {
  recording_->uploads.push_back(range);
  std::vector<uint8_t> bytes;
  if (data != nullptr) {
    const auto* begin = static_cast<const uint8_t*>(data);
    bytes.assign(begin,
                 begin + properties_.getBytesPerRange(range, static_cast<uint32_t>(bytesPerRow)));
  }
  recording_->uploadedData.push_back(std::move(bytes));
  return Result{};
}

} // namespace mipgen::tests::util::recording
