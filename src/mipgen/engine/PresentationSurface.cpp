/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/engine/PresentationSurface.h>

#include <algorithm>
#include <mipgen/Format.h>

namespace mipgen::engine {

bool PresentationSurface::ResizeListener::process(const WindowSizeEvent& event) {
  const std::lock_guard<std::mutex> lock(mailbox_->mutex);
  mailbox_->pending = event;
  return true;
}

PresentationSurface::PresentationSurface(DeviceContext& context) : context_(context) {}

PresentationSurface::~PresentationSurface() {
  if (window_ && listener_) {
    window_->removeResizeListener(listener_);
  }
}

WindowSizeEvent PresentationSurface::clampSize(uint32_t width,
                                               uint32_t height,
                                               size_t maxDimension) {
  const auto upper = maxDimension != 0
                         ? static_cast<uint32_t>(std::min<size_t>(maxDimension, UINT32_MAX))
                         : UINT32_MAX;
  return {std::clamp(width, 1u, upper), std::clamp(height, 1u, upper)};
}

bool PresentationSurface::init(IWindow& window, ResizeCallback onResize, Result* outResult) {
  if (surface_) {
    Result::setResult(outResult, Result::Code::InvalidOperation, "Surface already initialized");
    return false;
  }

  IDevice* device = context_.device(outResult);
  if (!device) {
    return false;
  }

  if (!device->hasFeature(DeviceFeatures::PremultipliedAlphaSurface)) {
    Result::setResult(outResult,
                      Result::Code::Unsupported,
                      "Device cannot present with premultiplied alpha");
    return false;
  }

  Result result;
  auto surface = device->createSurface(window, &result);
  if (!result.isOk() || !surface) {
    MIPGEN_LOG_ERROR("[%s] Failed to create a surface: %s\n",
                     context_.label().c_str(),
                     result.message.c_str());
    Result::setResult(outResult, std::move(result));
    return false;
  }

  const WindowSizeEvent windowSize = window.getSize();
  const WindowSizeEvent size =
      clampSize(windowSize.width, windowSize.height, context_.limits().maxTextureDimension2D);

  SurfaceConfig config;
  config.format = surface->getPreferredFormat();
  config.width = size.width;
  config.height = size.height;
  config.alphaMode = AlphaMode::Premultiplied;
  result = surface->configure(config);
  if (!result.isOk()) {
    Result::setResult(outResult, std::move(result));
    return false;
  }

  surface_ = std::move(surface);
  format_ = config.format;
  config_ = config;
  onResize_ = std::move(onResize);
  window_ = &window;
  listener_ = std::make_shared<ResizeListener>(mailbox_);
  window.addResizeListener(listener_);

  MIPGEN_LOG_INFO("[%s] Surface configured: %s %ux%u\n",
                  context_.label().c_str(),
                  TextureFormatProperties::fromTextureFormat(format_).name,
                  config_.width,
                  config_.height);

  Result::setOk(outResult);
  return true;
}

void PresentationSurface::notifyResize(uint32_t width, uint32_t height) {
  const std::lock_guard<std::mutex> lock(mailbox_->mutex);
  mailbox_->pending = WindowSizeEvent(width, height);
}

bool PresentationSurface::beginFrame(Result* outResult) {
  if (!ready()) {
    Result::setResult(outResult, Result::Code::NotInitialized, "Surface is not initialized");
    return false;
  }

  std::optional<WindowSizeEvent> pending;
  {
    const std::lock_guard<std::mutex> lock(mailbox_->mutex);
    pending.swap(mailbox_->pending);
  }
  Result::setOk(outResult);
  if (!pending) {
    return false;
  }

  const WindowSizeEvent size =
      clampSize(pending->width, pending->height, context_.limits().maxTextureDimension2D);
  if (size.width != pending->width || size.height != pending->height) {
    MIPGEN_LOG_DEBUG("[%s] Resize %ux%u clamped to %ux%u\n",
                     context_.label().c_str(),
                     pending->width,
                     pending->height,
                     size.width,
                     size.height);
  }

  SurfaceConfig config = config_;
  config.width = size.width;
  config.height = size.height;
  Result result = surface_->configure(config);
  if (!result.isOk()) {
    Result::setResult(outResult, std::move(result));
    return false;
  }
  config_ = config;

  if (onResize_) {
    onResize_(SurfaceBinding{*surface_, context_});
  }
  return true;
}

std::shared_ptr<IFramebuffer> PresentationSurface::currentFramebuffer() const {
  return surface_ ? surface_->getCurrentFramebuffer() : nullptr;
}

Result PresentationSurface::present() {
  if (!surface_) {
    return Result(Result::Code::NotInitialized, "Surface is not initialized");
  }
  return surface_->present();
}

} // namespace mipgen::engine
