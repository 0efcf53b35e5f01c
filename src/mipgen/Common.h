/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#ifndef MIPGEN_COMMON_H
#define MIPGEN_COMMON_H

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <mipgen/Core.h>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mipgen {

/// Texture units a bind group or pipeline can address.
constexpr uint32_t MIPGEN_TEXTURE_SAMPLERS_MAX = 16;

/// GL ES 3.0 guarantees at least four color attachments per framebuffer.
constexpr uint32_t MIPGEN_COLOR_ATTACHMENTS_MAX = 4;

/// Linear RGBA, laid out as float[4].
struct Color {
  float r;
  float g;
  float b;
  float a;

  constexpr Color(float r, float g, float b) : r(r), g(g), b(b), a(1.0f) {}
  constexpr Color(float r, float g, float b, float a) : r(r), g(g), b(b), a(a) {}
};

///--------------------------------------
/// MARK: - Result

/**
 * @brief Outcome of a fallible call. Functions that can fail take a trailing
 * `Result* outResult`, which may be null when the caller does not care about the reason.
 */
struct Result {
  enum class Code {
    Ok,

    /// Malformed descriptor, e.g. an invalid format or a missing attachment
    ArgumentInvalid,
    /// A required pointer argument was null
    ArgumentNull,
    /// A level, size or slot lies outside what the resource or device allows
    ArgumentOutOfRange,
    /// The call is not valid in the object's current state
    InvalidOperation,
    /// The device or platform lacks the requested capability
    Unsupported,
    /// The backend has no implementation for this call
    Unimplemented,
    /// The driver or window system failed
    RuntimeError,

    /// A component was used before init() succeeded
    NotInitialized,
    /// Adapter enumeration found nothing usable
    NoAdapter,
    /// An adapter was found but refused to create a device
    NoDevice,
    /// The texture format cannot be sampled and rendered to for mip generation
    UnsupportedFormat,
  };

  Code code = Code::Ok;
  std::string message;

  explicit Result() = default;
  explicit Result(Code code, const char* MIPGEN_NULLABLE message = "") :
    code(code), message(message != nullptr ? message : "") {}
  explicit Result(Code code, std::string message) : code(code), message(std::move(message)) {}

  [[nodiscard]] bool isOk() const {
    return code == Code::Ok;
  }

  static void setResult(Result* MIPGEN_NULLABLE outResult,
                        Code code,
                        const std::string& message = "") {
    if (outResult != nullptr) {
      outResult->code = code;
      outResult->message = message;
    }
  }

  static void setResult(Result* MIPGEN_NULLABLE outResult, const Result& sourceResult) {
    if (outResult != nullptr) {
      *outResult = sourceResult;
    }
  }

  static void setResult(Result* MIPGEN_NULLABLE outResult, Result&& sourceResult) {
    if (outResult != nullptr) {
      *outResult = std::move(sourceResult);
    }
  }

  static void setOk(Result* MIPGEN_NULLABLE outResult) {
    if (outResult != nullptr) {
      outResult->code = Code::Ok;
      outResult->message.clear();
    }
  }
};

std::string ResultCodeToString(Result::Code code);

/// Custom is any backend implemented outside this library.
enum class BackendType {
  Invalid,
  OpenGL,
  Custom,
};
std::string BackendTypeToString(BackendType backendType);

///--------------------------------------
/// MARK: - Dimensions

/// Size of a 2D texture level in texels.
struct Dimensions {
  uint32_t width = 0;
  uint32_t height = 0;

  /// Size of mip level `level` of a texture whose base level has this size. Never below 1x1.
  [[nodiscard]] Dimensions atLevel(uint32_t level) const {
    const auto halve = [level](uint32_t size) {
      return level >= 32 ? 1u : std::max(size >> level, 1u);
    };
    return Dimensions{halve(width), halve(height)};
  }
};

inline bool operator==(const Dimensions& lhs, const Dimensions& rhs) {
  return lhs.width == rhs.width && lhs.height == rhs.height;
}

inline bool operator!=(const Dimensions& lhs, const Dimensions& rhs) {
  return !(lhs == rhs);
}

/// Render area of a pass, in pixels of the target level.
struct Viewport {
  float x = 0.0f;
  float y = 0.0f;
  float width = 1.0f;
  float height = 1.0f;
};

} // namespace mipgen

#endif // MIPGEN_COMMON_H
