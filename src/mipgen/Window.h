/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <memory>

namespace mipgen {

struct WindowSizeEvent {
  uint32_t width = 0;
  uint32_t height = 0;

  WindowSizeEvent() = default;
  WindowSizeEvent(uint32_t width, uint32_t height) : width(width), height(height) {}
};

/**
 * @brief Receives window size changes. May be invoked on any thread.
 */
class IResizeListener {
 public:
  virtual bool process(const WindowSizeEvent& event) = 0;

  virtual ~IResizeListener() = default;
};

/**
 * @brief A platform window a presentation surface can be created for. Window creation and the
 * source of resize events belong to the platform layer.
 */
class IWindow {
 public:
  virtual ~IWindow() = default;

  /** @brief Native handle (EGLNativeWindowType on EGL platforms). */
  [[nodiscard]] virtual uintptr_t getNativeWindow() const = 0;
  /** @brief Current drawable size in pixels. */
  [[nodiscard]] virtual WindowSizeEvent getSize() const = 0;

  virtual void addResizeListener(const std::shared_ptr<IResizeListener>& listener) = 0;
  virtual void removeResizeListener(const std::shared_ptr<IResizeListener>& listener) = 0;
};

} // namespace mipgen
