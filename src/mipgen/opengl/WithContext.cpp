/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/opengl/WithContext.h>

#include <mipgen/opengl/IContext.h>

namespace mipgen::opengl {

WithContext::WithContext(IContext& context) : context_(context) {
  context_.addRef();
}

WithContext::~WithContext() {
  [[maybe_unused]] const bool released = context_.releaseRef();
  MIPGEN_SOFT_ASSERT(released, "GL object released more often than it was created");
}

} // namespace mipgen::opengl
