/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

namespace mipgen::opengl {
class IContext;

/// Base of every GL object. Counts itself as a user of the context so that tearing the context
/// down while textures, samplers or framebuffers are alive is reported.
class WithContext {
 public:
  explicit WithContext(IContext& context);
  virtual ~WithContext();

  WithContext(const WithContext&) = delete;
  WithContext& operator=(const WithContext&) = delete;

  [[nodiscard]] IContext& getContext() const {
    return context_;
  }

 private:
  IContext& context_;
};

} // namespace mipgen::opengl
