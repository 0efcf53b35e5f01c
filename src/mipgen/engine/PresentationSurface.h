/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <functional>
#include <memory>
#include <mipgen/engine/DeviceContext.h>
#include <mutex>
#include <optional>

namespace mipgen::engine {

/// What a resize callback gets to rebuild size-dependent resources.
struct SurfaceBinding {
  ISurface& surface;
  DeviceContext& context;
};

using ResizeCallback = std::function<void(const SurfaceBinding&)>;

///--------------------------------------
/// MARK: - PresentationSurface

/// Binds a window to the device and keeps its back buffers sized to the window. Resize events may
/// arrive on any thread; they are parked in a single slot (the newest replaces older ones) and
/// applied on the render thread by beginFrame().
class PresentationSurface final {
 public:
  explicit PresentationSurface(DeviceContext& context);
  ~PresentationSurface();

  PresentationSurface(const PresentationSurface&) = delete;
  PresentationSurface& operator=(const PresentationSurface&) = delete;

  /// `window` must outlive this object.
  bool init(IWindow& window,
            ResizeCallback onResize,
            Result* MIPGEN_NULLABLE outResult = nullptr);

  [[nodiscard]] bool ready() const noexcept {
    return surface_ != nullptr && format_ != TextureFormat::Invalid;
  }

  /// Parks a resize for the next beginFrame(). Thread safe.
  void notifyResize(uint32_t width, uint32_t height);

  /// Applies the parked resize, if any. Returns true when the surface was reconfigured.
  bool beginFrame(Result* MIPGEN_NULLABLE outResult = nullptr);

  Result present();

  [[nodiscard]] TextureFormat format() const noexcept {
    return format_;
  }
  [[nodiscard]] WindowSizeEvent size() const noexcept {
    return {config_.width, config_.height};
  }
  [[nodiscard]] const std::shared_ptr<ISurface>& surface() const noexcept {
    return surface_;
  }
  [[nodiscard]] std::shared_ptr<IFramebuffer> currentFramebuffer() const;

  /// Clamps each axis to [1, maxDimension]. A maxDimension of 0 leaves the upper bound open.
  static WindowSizeEvent clampSize(uint32_t width, uint32_t height, size_t maxDimension);

 private:
  struct Mailbox {
    std::mutex mutex;
    std::optional<WindowSizeEvent> pending;
  };

  class ResizeListener final : public IResizeListener {
   public:
    explicit ResizeListener(std::shared_ptr<Mailbox> mailbox) : mailbox_(std::move(mailbox)) {}
    bool process(const WindowSizeEvent& event) override;

   private:
    std::shared_ptr<Mailbox> mailbox_;
  };

  DeviceContext& context_;
  IWindow* MIPGEN_NULLABLE window_ = nullptr;
  ResizeCallback onResize_;
  std::shared_ptr<ISurface> surface_;
  TextureFormat format_ = TextureFormat::Invalid;
  SurfaceConfig config_;
  std::shared_ptr<Mailbox> mailbox_ = std::make_shared<Mailbox>();
  std::shared_ptr<ResizeListener> listener_;
};

} // namespace mipgen::engine
