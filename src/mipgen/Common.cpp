/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/Common.h>

namespace mipgen {

// Make sure the structure mipgen::Color is tightly packed so it can be passed into APIs which
// expect float[4] RGBA values
static_assert(sizeof(Color) == 4 * sizeof(float));

std::string ResultCodeToString(Result::Code code) {
  switch (code) {
    MIPGEN_ENUM_TO_STRING(Result::Code, Ok)
    MIPGEN_ENUM_TO_STRING(Result::Code, ArgumentInvalid)
    MIPGEN_ENUM_TO_STRING(Result::Code, ArgumentNull)
    MIPGEN_ENUM_TO_STRING(Result::Code, ArgumentOutOfRange)
    MIPGEN_ENUM_TO_STRING(Result::Code, InvalidOperation)
    MIPGEN_ENUM_TO_STRING(Result::Code, Unsupported)
    MIPGEN_ENUM_TO_STRING(Result::Code, Unimplemented)
    MIPGEN_ENUM_TO_STRING(Result::Code, RuntimeError)
    MIPGEN_ENUM_TO_STRING(Result::Code, NotInitialized)
    MIPGEN_ENUM_TO_STRING(Result::Code, NoAdapter)
    MIPGEN_ENUM_TO_STRING(Result::Code, NoDevice)
    MIPGEN_ENUM_TO_STRING(Result::Code, UnsupportedFormat)
  }
  MIPGEN_UNREACHABLE_RETURN(std::string())
}

std::string BackendTypeToString(BackendType backendType) {
  switch (backendType) {
  case BackendType::Invalid:
    return "Invalid";
  case BackendType::OpenGL:
    return "OpenGL";
  case BackendType::Custom:
    return "Custom";
  }
  MIPGEN_UNREACHABLE_RETURN(std::string())
}

} // namespace mipgen
