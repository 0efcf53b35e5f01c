/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/engine/TextureFactory.h>

#include <algorithm>
#include <mipgen/Format.h>

namespace mipgen::engine {

TextureFactory::TextureFactory(DeviceContext& context, MipGenerator& mipGenerator) :
  context_(context), mipGenerator_(mipGenerator) {}

CreatedTexture TextureFactory::createTexture(const TextureSpec& spec, Result* outResult) {
  const ImageSource& image = spec.image;
  if (image.pixels == nullptr) {
    Result::setResult(outResult, Result::Code::ArgumentNull, "Image has no pixels");
    return {};
  }
  if (image.width == 0 || image.height == 0) {
    Result::setResult(outResult,
                      Result::Code::ArgumentInvalid,
                      MIPGEN_FORMAT("Invalid image size {}x{}", image.width, image.height));
    return {};
  }

  IDevice* device = context_.device(outResult);
  if (!device) {
    return {};
  }

  const DeviceLimits limits = context_.limits();
  if (limits.maxTextureDimension2D != 0 &&
      std::max(image.width, image.height) > limits.maxTextureDimension2D) {
    Result::setResult(outResult,
                      Result::Code::ArgumentOutOfRange,
                      MIPGEN_FORMAT("Image {}x{} exceeds the device limit of {}",
                                    image.width,
                                    image.height,
                                    limits.maxTextureDimension2D));
    return {};
  }

  TextureDesc desc =
      TextureDesc::new2D(spec.format, image.width, image.height, kUsage, spec.debugName.c_str());
  desc.numMipLevels =
      spec.generateMipmaps ? MipGenerator::countLevels(image.width, image.height) : 1;

  Result result;
  CreatedTexture created;
  created.texture = device->createTexture(desc, &result);
  if (!result.isOk() || !created.texture) {
    MIPGEN_LOG_ERROR("[%s] Failed to create texture '%s': %s\n",
                     context_.label().c_str(),
                     spec.debugName.c_str(),
                     result.message.c_str());
    Result::setResult(outResult, std::move(result));
    return {};
  }

  result = created.texture->upload(TextureRangeDesc::new2D(0, 0, image.width, image.height),
                                   image.pixels,
                                   image.bytesPerRow,
                                   image.flipY);
  if (!result.isOk()) {
    Result::setResult(outResult, std::move(result));
    return {};
  }

  if (desc.numMipLevels > 1) {
    auto generation = mipGenerator_.generate(created.texture, desc.numMipLevels, &result);
    if (!result.isOk()) {
      Result::setResult(outResult, std::move(result));
      return {};
    }
    created.generatedLevels = generation.generatedLevels;
    created.pending =
        PendingSubmission(std::move(generation.commandBuffer), generation.submitHandle);
  }

  MIPGEN_LOG_DEBUG("[%s] Created texture '%s' %ux%u, %u levels, ~%zu bytes\n",
                   context_.label().c_str(),
                   spec.debugName.c_str(),
                   image.width,
                   image.height,
                   desc.numMipLevels,
                   created.texture->getEstimatedSizeInBytes());

  Result::setOk(outResult);
  return created;
}

} // namespace mipgen::engine
