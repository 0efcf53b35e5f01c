/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <gtest/gtest.h>

#include "../util/TestErrorGuard.h"
#include "../util/recording/Device.h"
#include "../util/recording/Recording.h"

#include <memory>
#include <mipgen/engine/DeviceContext.h>

namespace mipgen::tests {

/// Fixture wiring a DeviceContext to the recording backend. Call `initContext()` after adjusting
/// `config_` or `hwDevice_`; SetUp() leaves the context uninitialized.
class EngineTestBase : public ::testing::Test {
 public:
  void SetUp() override {
    resetContext();
  }

  void TearDown() override {
    context_.reset();
  }

 protected:
  /// Recreates an uninitialized context using the current `config_`.
  void resetContext() {
    recording_ = std::make_shared<util::recording::Recording>();
    auto hwDevice = std::make_unique<util::recording::HWDevice>(config_, recording_);
    hwDevice_ = hwDevice.get();
    engine::DeviceContextDesc desc;
    desc.label = "test";
    context_ = std::make_unique<engine::DeviceContext>(desc, std::move(hwDevice));
  }

  void initContext() {
    Result ret;
    ASSERT_TRUE(context_->init(&ret));
    ASSERT_EQ(ret.code, Result::Code::Ok) << ret.message;
  }

  [[nodiscard]] util::recording::Device& recordingDevice() const {
    return static_cast<util::recording::Device&>(*context_->device());
  }

  std::shared_ptr<ITexture> createTexture(TextureFormat format,
                                          uint32_t width,
                                          uint32_t height,
                                          uint32_t numMipLevels,
                                          TextureDesc::TextureUsage usage =
                                              TextureDesc::TextureUsageBits::Sampled |
                                              TextureDesc::TextureUsageBits::Attachment) {
    auto desc = TextureDesc::new2D(format, width, height, usage, "test texture");
    desc.numMipLevels = numMipLevels;
    Result ret;
    auto texture = context_->device()->createTexture(desc, &ret);
    EXPECT_EQ(ret.code, Result::Code::Ok) << ret.message;
    return texture;
  }

  util::TestErrorGuard errorGuard_;
  util::recording::DeviceConfig config_;
  std::shared_ptr<util::recording::Recording> recording_;
  util::recording::HWDevice* hwDevice_ = nullptr;
  std::unique_ptr<engine::DeviceContext> context_;
};

} // namespace mipgen::tests
