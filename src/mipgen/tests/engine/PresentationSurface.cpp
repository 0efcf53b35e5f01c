/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "EngineTestBase.h"

#include "../util/recording/Surface.h"

#include <mipgen/engine/PresentationSurface.h>
#include <thread>

namespace mipgen::tests {

class PresentationSurfaceTest : public EngineTestBase {
 public:
  void SetUp() override {
    EngineTestBase::SetUp();
    initContext();
    surface_ = std::make_unique<engine::PresentationSurface>(*context_);
  }

  void TearDown() override {
    surface_.reset();
    EngineTestBase::TearDown();
  }

 protected:
  void initSurface() {
    Result ret;
    ASSERT_TRUE(surface_->init(
        window_,
        [this](const engine::SurfaceBinding& binding) {
          ++resizeCallbacks_;
          lastBoundSurface_ = &binding.surface;
          lastBoundContext_ = &binding.context;
        },
        &ret))
        << ret.message;
  }

  util::recording::Window window_{640, 480};
  std::unique_ptr<engine::PresentationSurface> surface_;
  int resizeCallbacks_ = 0;
  const ISurface* lastBoundSurface_ = nullptr;
  const engine::DeviceContext* lastBoundContext_ = nullptr;
};

TEST_F(PresentationSurfaceTest, InitConfiguresPreferredFormatWithPremultipliedAlpha) {
  EXPECT_FALSE(surface_->ready());
  initSurface();

  EXPECT_TRUE(surface_->ready());
  EXPECT_EQ(surface_->format(), TextureFormat::BGRA_UNorm8);
  EXPECT_EQ(surface_->size().width, 640u);
  EXPECT_EQ(surface_->size().height, 480u);
  EXPECT_NE(surface_->surface(), nullptr);
  EXPECT_NE(surface_->currentFramebuffer(), nullptr);
  EXPECT_EQ(window_.getListenerCount(), 1u);

  ASSERT_EQ(recording_->surfaceConfigs.size(), 1u);
  const auto& config = recording_->surfaceConfigs[0];
  EXPECT_EQ(config.format, TextureFormat::BGRA_UNorm8);
  EXPECT_EQ(config.width, 640u);
  EXPECT_EQ(config.height, 480u);
  EXPECT_EQ(config.alphaMode, AlphaMode::Premultiplied);
  EXPECT_EQ(resizeCallbacks_, 0);
}

TEST_F(PresentationSurfaceTest, InitRequiresReadyContext) {
  surface_.reset();
  resetContext();
  surface_ = std::make_unique<engine::PresentationSurface>(*context_);

  Result ret;
  EXPECT_FALSE(surface_->init(window_, nullptr, &ret));
  EXPECT_EQ(ret.code, Result::Code::NotInitialized);
  EXPECT_FALSE(surface_->ready());
  EXPECT_EQ(window_.getListenerCount(), 0u);
}

TEST_F(PresentationSurfaceTest, InitTwiceFails) {
  initSurface();
  Result ret;
  EXPECT_FALSE(surface_->init(window_, nullptr, &ret));
  EXPECT_EQ(ret.code, Result::Code::InvalidOperation);
  EXPECT_EQ(window_.getListenerCount(), 1u);
}

TEST_F(PresentationSurfaceTest, WindowResizeAppliesAtFrameStart) {
  initSurface();
  window_.resize(800, 600);

  // Nothing changes until the render thread asks.
  EXPECT_EQ(surface_->size().width, 640u);
  EXPECT_EQ(resizeCallbacks_, 0);

  Result ret;
  EXPECT_TRUE(surface_->beginFrame(&ret));
  EXPECT_TRUE(ret.isOk());
  EXPECT_EQ(surface_->size().width, 800u);
  EXPECT_EQ(surface_->size().height, 600u);
  EXPECT_EQ(resizeCallbacks_, 1);
  EXPECT_EQ(lastBoundSurface_, surface_->surface().get());
  EXPECT_EQ(lastBoundContext_, context_.get());
  ASSERT_EQ(recording_->surfaceConfigs.size(), 2u);
  EXPECT_EQ(recording_->surfaceConfigs[1].width, 800u);

  EXPECT_FALSE(surface_->beginFrame(&ret));
  EXPECT_TRUE(ret.isOk());
  EXPECT_EQ(resizeCallbacks_, 1);
}

TEST_F(PresentationSurfaceTest, LatestResizeWins) {
  initSurface();
  surface_->notifyResize(100, 100);
  surface_->notifyResize(200, 300);

  EXPECT_TRUE(surface_->beginFrame());
  EXPECT_EQ(surface_->size().width, 200u);
  EXPECT_EQ(surface_->size().height, 300u);
  EXPECT_EQ(resizeCallbacks_, 1);
  EXPECT_EQ(recording_->surfaceConfigs.size(), 2u);
}

TEST_F(PresentationSurfaceTest, ResizeIsClampedToDeviceLimits) {
  initSurface();

  surface_->notifyResize(5000, 5000);
  EXPECT_TRUE(surface_->beginFrame());
  EXPECT_EQ(surface_->size().width, 4096u);
  EXPECT_EQ(surface_->size().height, 4096u);

  surface_->notifyResize(0, 0);
  EXPECT_TRUE(surface_->beginFrame());
  EXPECT_EQ(surface_->size().width, 1u);
  EXPECT_EQ(surface_->size().height, 1u);
  EXPECT_EQ(resizeCallbacks_, 2);
}

TEST_F(PresentationSurfaceTest, ClampSize) {
  const auto clamped = engine::PresentationSurface::clampSize(5000, 0, 4096);
  EXPECT_EQ(clamped.width, 4096u);
  EXPECT_EQ(clamped.height, 1u);

  const auto unbounded = engine::PresentationSurface::clampSize(5000, 7, 0);
  EXPECT_EQ(unbounded.width, 5000u);
  EXPECT_EQ(unbounded.height, 7u);
}

TEST_F(PresentationSurfaceTest, InitialWindowSizeIsClamped) {
  window_.resize(10000, 0);
  initSurface();
  EXPECT_EQ(surface_->size().width, 4096u);
  EXPECT_EQ(surface_->size().height, 1u);
}

TEST_F(PresentationSurfaceTest, ResizeFromAnotherThread) {
  initSurface();
  std::thread resizer([this] { window_.resize(320, 200); });
  resizer.join();

  EXPECT_TRUE(surface_->beginFrame());
  EXPECT_EQ(surface_->size().width, 320u);
  EXPECT_EQ(surface_->size().height, 200u);
}

TEST_F(PresentationSurfaceTest, InitFailsWithoutPremultipliedAlpha) {
  surface_.reset();
  config_.supportsPremultipliedAlpha = false;
  resetContext();
  initContext();
  surface_ = std::make_unique<engine::PresentationSurface>(*context_);

  Result ret;
  EXPECT_FALSE(surface_->init(window_, nullptr, &ret));
  EXPECT_EQ(ret.code, Result::Code::Unsupported);
  EXPECT_FALSE(surface_->ready());
  EXPECT_EQ(surface_->surface(), nullptr);
  EXPECT_EQ(window_.getListenerCount(), 0u);
  EXPECT_TRUE(recording_->surfaceConfigs.empty());
}

TEST_F(PresentationSurfaceTest, ConfigureRejectsPremultipliedAlphaWhenUnsupported) {
  surface_.reset();
  config_.supportsPremultipliedAlpha = false;
  resetContext();
  initContext();

  Result ret;
  auto surface = recordingDevice().createSurface(window_, &ret);
  ASSERT_NE(surface, nullptr) << ret.message;

  SurfaceConfig config;
  config.format = surface->getPreferredFormat();
  config.width = 64;
  config.height = 64;
  config.alphaMode = AlphaMode::Premultiplied;
  EXPECT_EQ(surface->configure(config).code, Result::Code::Unsupported);
  EXPECT_TRUE(recording_->surfaceConfigs.empty());

  config.alphaMode = AlphaMode::Opaque;
  EXPECT_TRUE(surface->configure(config).isOk());
  EXPECT_EQ(recording_->surfaceConfigs.size(), 1u);
}

TEST_F(PresentationSurfaceTest, Present) {
  EXPECT_EQ(surface_->present().code, Result::Code::NotInitialized);
  initSurface();
  EXPECT_TRUE(surface_->present().isOk());
  EXPECT_EQ(recording_->presents, 1u);
}

TEST_F(PresentationSurfaceTest, BeginFrameBeforeInit) {
  Result ret;
  EXPECT_FALSE(surface_->beginFrame(&ret));
  EXPECT_EQ(ret.code, Result::Code::NotInitialized);
}

TEST_F(PresentationSurfaceTest, DestructionUnregistersListener) {
  initSurface();
  EXPECT_EQ(window_.getListenerCount(), 1u);
  surface_.reset();
  EXPECT_EQ(window_.getListenerCount(), 0u);
  window_.resize(10, 10);
}

} // namespace mipgen::tests
