/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include "../util/TestDevice.h"
#include "../util/TestErrorGuard.h"

#include <array>
#include <mipgen/Device.h>
#include <mipgen/engine/ShaderProgram.h>
#include <mipgen/opengl/Device.h>
#include <mipgen/opengl/IContext.h>
#include <string>

namespace mipgen::tests {

class OglDeviceTest : public ::testing::Test {
 public:
  void SetUp() override {
    device_ = util::createTestDevice();
    if (!device_) {
      GTEST_SKIP() << "No EGL display available";
    }
    Result ret;
    queue_ = device_->createCommandQueue(CommandQueueDesc{}, &ret);
    ASSERT_TRUE(ret.isOk()) << ret.message;
  }

  void TearDown() override {
    queue_.reset();
    device_.reset();
  }

 protected:
  std::shared_ptr<ITexture> createTexture(uint32_t width, uint32_t height, uint32_t levels) {
    auto desc = TextureDesc::new2D(TextureFormat::RGBA_UNorm8,
                                   width,
                                   height,
                                   TextureDesc::TextureUsageBits::Sampled |
                                       TextureDesc::TextureUsageBits::Attachment |
                                       TextureDesc::TextureUsageBits::CopyDst);
    desc.numMipLevels = levels;
    Result ret;
    auto texture = device_->createTexture(desc, &ret);
    EXPECT_TRUE(ret.isOk()) << ret.message;
    return texture;
  }

  util::TestErrorGuard errorGuard_;
  std::shared_ptr<IDevice> device_;
  std::shared_ptr<ICommandQueue> queue_;
};

TEST_F(OglDeviceTest, BackendAndLimits) {
  EXPECT_EQ(device_->getBackendType(), BackendType::OpenGL);
  size_t maxDimension = 0;
  ASSERT_TRUE(device_->getFeatureLimits(DeviceFeatureLimits::MaxTextureDimension1D2D,
                                        maxDimension));
  // GLES 3.0 guarantees 2048.
  EXPECT_GE(maxDimension, 2048u);
}

TEST_F(OglDeviceTest, FormatCapabilities) {
  const auto rgba = device_->getTextureFormatCapabilities(TextureFormat::RGBA_UNorm8);
  EXPECT_TRUE(contains(rgba, ICapabilities::TextureFormatCapabilityBits::SampledFiltered));
  EXPECT_TRUE(contains(rgba, ICapabilities::TextureFormatCapabilityBits::Attachment));

  const auto integer = device_->getTextureFormatCapabilities(TextureFormat::RGBA_UInt32);
  EXPECT_FALSE(contains(integer, ICapabilities::TextureFormatCapabilityBits::SampledFiltered));

  EXPECT_EQ(device_->getTextureFormatCapabilities(TextureFormat::Invalid),
            ICapabilities::TextureFormatCapabilityBits::Unsupported);
}

TEST_F(OglDeviceTest, TooManyMipLevelsIsRejected) {
  auto desc = TextureDesc::new2D(
      TextureFormat::RGBA_UNorm8, 16, 16, TextureDesc::TextureUsageBits::Sampled);
  desc.numMipLevels = 6;
  Result ret;
  EXPECT_EQ(device_->createTexture(desc, &ret), nullptr);
  EXPECT_FALSE(ret.isOk());
}

TEST_F(OglDeviceTest, TextureViewRange) {
  auto texture = createTexture(16, 16, 5);
  ASSERT_NE(texture, nullptr);

  TextureViewDesc viewDesc;
  viewDesc.mipLevel = 2;
  viewDesc.numMipLevels = 2;
  Result ret;
  auto view = device_->createTextureView(texture, viewDesc, &ret);
  ASSERT_TRUE(ret.isOk()) << ret.message;
  ASSERT_NE(view, nullptr);
  EXPECT_EQ(view->getBaseMipLevel(), 2u);
  EXPECT_EQ(view->getNumMipLevels(), 2u);
  EXPECT_EQ(view->getDimensions().width, 4u);
  EXPECT_FALSE(view->supportsUpload());

  viewDesc.mipLevel = 1;
  viewDesc.numMipLevels = 1;
  auto nested = device_->createTextureView(view, viewDesc, &ret);
  ASSERT_TRUE(ret.isOk());
  EXPECT_EQ(nested->getBaseMipLevel(), 3u);
  EXPECT_EQ(nested->getDimensions().width, 2u);

  viewDesc.mipLevel = 4;
  viewDesc.numMipLevels = 2;
  EXPECT_EQ(device_->createTextureView(texture, viewDesc, &ret), nullptr);
  EXPECT_EQ(ret.code, Result::Code::ArgumentOutOfRange);

  EXPECT_EQ(device_->createTextureView(nullptr, TextureViewDesc{}, &ret), nullptr);
  EXPECT_EQ(ret.code, Result::Code::ArgumentNull);
}

TEST_F(OglDeviceTest, UploadAndReadBackLevelOne) {
  auto texture = createTexture(4, 4, 3);
  ASSERT_NE(texture, nullptr);

  const std::array<uint32_t, 4> level1 = {0xff0000ff, 0xff00ff00, 0xffff0000, 0xffffffff};
  ASSERT_TRUE(texture->upload(texture->getFullRange(1), level1.data()).isOk());

  FramebufferDesc framebufferDesc;
  framebufferDesc.colorAttachments[0].texture = texture;
  Result ret;
  auto framebuffer = device_->createFramebuffer(framebufferDesc, &ret);
  ASSERT_TRUE(ret.isOk()) << ret.message;

  std::array<uint32_t, 4> readBack = {};
  framebuffer->copyBytesColorAttachment(*queue_, 0, readBack.data(), texture->getFullRange(1));
  EXPECT_EQ(readBack, level1);
}

TEST_F(OglDeviceTest, RenderPassOutsideAttachmentLevelsFails) {
  auto texture = createTexture(4, 4, 3);
  FramebufferDesc framebufferDesc;
  framebufferDesc.colorAttachments[0].texture = texture;
  Result ret;
  auto framebuffer = device_->createFramebuffer(framebufferDesc, &ret);
  ASSERT_NE(framebuffer, nullptr);

  auto commandBuffer = queue_->createCommandBuffer(CommandBufferDesc{"out of range"}, &ret);
  ASSERT_NE(commandBuffer, nullptr);

  RenderPassDesc renderPass;
  renderPass.colorAttachments.resize(1);
  renderPass.colorAttachments[0].mipLevel = 3;
  auto encoder = commandBuffer->createRenderCommandEncoder(renderPass, framebuffer, &ret);
  EXPECT_EQ(encoder, nullptr);
  EXPECT_EQ(ret.code, Result::Code::ArgumentOutOfRange);
}

TEST_F(OglDeviceTest, BindGroupNeedsTextureForEverySampledUnit) {
  Result ret;
  auto program = engine::ShaderProgram::create(*device_, TextureFormat::RGBA_UNorm8, "", &ret);
  ASSERT_NE(program, nullptr) << ret.message;

  BindGroupDesc desc;
  desc.debugName = "no source";
  EXPECT_EQ(device_->createBindGroup(desc, program->pipeline().get(), &ret), nullptr);
  EXPECT_EQ(ret.code, Result::Code::ArgumentInvalid);

  std::weak_ptr<ITexture> source;
  {
    auto texture = createTexture(4, 4, 1);
    source = texture;
    desc.textures[program->sourceUnit()] = std::move(texture);
    desc.debugName = "source";
    auto bindGroup = device_->createBindGroup(desc, program->pipeline().get(), &ret);
    ASSERT_NE(bindGroup, nullptr) << ret.message;
    desc = BindGroupDesc{};
    EXPECT_FALSE(source.expired());
  }
  EXPECT_TRUE(source.expired());
}

TEST_F(OglDeviceTest, UnsubmittedCommandBufferIsNotCompleted) {
  Result ret;
  auto commandBuffer = queue_->createCommandBuffer(CommandBufferDesc{}, &ret);
  ASSERT_NE(commandBuffer, nullptr);
  EXPECT_FALSE(commandBuffer->isCompleted());
  // Returns immediately for buffers that were never submitted.
  commandBuffer->waitUntilCompleted();

  EXPECT_NE(queue_->submit(*commandBuffer), 0u);
  commandBuffer->waitUntilCompleted();
  EXPECT_TRUE(commandBuffer->isCompleted());
}

TEST_F(OglDeviceTest, GLErrorIsReportedOnce) {
  auto& ctx = static_cast<opengl::Device&>(*device_).getContext();
  ASSERT_TRUE(ctx.checkForErrors("setup").isOk());

  ctx.disable(0xFFFF);
  const Result result = ctx.checkForErrors("disable");
  EXPECT_EQ(result.code, Result::Code::ArgumentInvalid);
  EXPECT_NE(result.message.find("GL_INVALID_ENUM"), std::string::npos) << result.message;

  EXPECT_TRUE(ctx.checkForErrors("again").isOk());
}

} // namespace mipgen::tests
