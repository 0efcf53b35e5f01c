/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "EngineTestBase.h"

#include "../util/recording/Resources.h"

#include <algorithm>
#include <mipgen/engine/MipGenerator.h>
#include <string>

namespace mipgen::tests {

TEST(MipGeneratorCountLevelsTest, KnownSizes) {
  util::TestErrorGuard guard;
  EXPECT_EQ(engine::MipGenerator::countLevels(1, 1), 1u);
  EXPECT_EQ(engine::MipGenerator::countLevels(2, 1), 2u);
  EXPECT_EQ(engine::MipGenerator::countLevels(256, 256), 9u);
  EXPECT_EQ(engine::MipGenerator::countLevels(300, 150), 9u);
  EXPECT_EQ(engine::MipGenerator::countLevels(1, 1024), 11u);
  EXPECT_EQ(engine::MipGenerator::countLevels({640, 480, 4}), 10u);
  EXPECT_EQ(engine::MipGenerator::countLevels(4096), 13u);
}

TEST(MipGeneratorCountLevelsTest, MonotonicInLargestSide) {
  util::TestErrorGuard guard;
  uint32_t previous = 0;
  for (uint32_t size = 1; size <= 4096; ++size) {
    const uint32_t levels = engine::MipGenerator::countLevels(size, 1);
    EXPECT_GE(levels, previous) << size;
    EXPECT_EQ(levels, TextureDesc::calcNumMipLevels(size, 1)) << size;
    previous = levels;
  }
}

TEST(MipGeneratorCountLevelsTest, NonPositiveSizeReturnsZero) {
  // No error guard: a soft error is the expected outcome.
  EXPECT_EQ(engine::MipGenerator::countLevels(0, 0), 0u);
  EXPECT_EQ(engine::MipGenerator::countLevels(-4, 0), 0u);
}

class MipGeneratorTest : public EngineTestBase {
 public:
  void SetUp() override {
    EngineTestBase::SetUp();
    initContext();
    createGenerator();
  }

  void TearDown() override {
    generator_.reset();
    cache_.reset();
    EngineTestBase::TearDown();
  }

 protected:
  void createGenerator(engine::MipGeneratorDesc desc = {}) {
    generator_.reset();
    cache_ = std::make_unique<engine::PipelineCache>(*context_);
    generator_ = std::make_unique<engine::MipGenerator>(*context_, *cache_, std::move(desc));
    Result ret;
    ASSERT_TRUE(generator_->init(&ret)) << ret.message;
  }

  std::unique_ptr<engine::PipelineCache> cache_;
  std::unique_ptr<engine::MipGenerator> generator_;
};

TEST_F(MipGeneratorTest, InitCreatesOneClampedLinearSampler) {
  EXPECT_TRUE(generator_->ready());
  EXPECT_TRUE(generator_->init());
  EXPECT_EQ(recording_->samplersCreated, 1u);

  Result ret;
  auto sampler = generator_->sampler(&ret);
  ASSERT_NE(sampler, nullptr);
  const auto& desc = static_cast<util::recording::SamplerState&>(*sampler).getDesc();
  EXPECT_EQ(desc.minFilter, SamplerMinMagFilter::Linear);
  EXPECT_EQ(desc.magFilter, SamplerMinMagFilter::Linear);
  EXPECT_EQ(desc.mipFilter, SamplerMipFilter::Disabled);
  EXPECT_EQ(desc.addressModeU, SamplerAddressMode::Clamp);
  EXPECT_EQ(desc.addressModeV, SamplerAddressMode::Clamp);
}

TEST_F(MipGeneratorTest, GenerateBeforeInitFails) {
  engine::MipGenerator generator(*context_, *cache_);
  auto texture = createTexture(TextureFormat::RGBA_UNorm8, 16, 16, 5);

  Result ret;
  EXPECT_EQ(generator.sampler(&ret), nullptr);
  EXPECT_EQ(ret.code, Result::Code::NotInitialized);

  ret = Result();
  const auto generation = generator.generate(texture, 0, &ret);
  EXPECT_EQ(ret.code, Result::Code::NotInitialized);
  EXPECT_EQ(generation.generatedLevels, 0u);
  EXPECT_TRUE(recording_->passes.empty());
}

TEST_F(MipGeneratorTest, InitRequiresReadyContext) {
  resetContext();
  engine::PipelineCache cache(*context_);
  engine::MipGenerator generator(*context_, cache);
  Result ret;
  EXPECT_FALSE(generator.init(&ret));
  EXPECT_EQ(ret.code, Result::Code::NotInitialized);
  EXPECT_FALSE(generator.ready());
}

TEST_F(MipGeneratorTest, FullChainFor256x256) {
  auto texture = createTexture(TextureFormat::RGBA_UNorm8, 256, 256, 9);

  Result ret;
  const auto generation = generator_->generate(texture, 0, &ret);
  ASSERT_TRUE(ret.isOk()) << ret.message;
  EXPECT_EQ(generation.generatedLevels, 8u);
  EXPECT_NE(generation.submitHandle, 0u);
  ASSERT_NE(generation.commandBuffer, nullptr);
  EXPECT_TRUE(generation.commandBuffer->isCompleted());
  EXPECT_EQ(recording_->submits, 1u);

  ASSERT_EQ(recording_->passes.size(), 8u);
  for (uint32_t i = 0; i < recording_->passes.size(); ++i) {
    const auto& pass = recording_->passes[i];
    const uint32_t expectedSize = std::max(256u >> (i + 1), 1u);
    EXPECT_EQ(pass.sourceLevel, static_cast<int>(i));
    EXPECT_EQ(pass.targetLevel, i + 1);
    EXPECT_EQ(pass.targetWidth, expectedSize);
    EXPECT_EQ(pass.targetHeight, expectedSize);
    EXPECT_EQ(pass.viewport.width, static_cast<float>(expectedSize));
    EXPECT_EQ(pass.viewport.height, static_cast<float>(expectedSize));
    EXPECT_EQ(pass.vertexCount, 6u);
    EXPECT_TRUE(pass.pipelineBound);
    EXPECT_TRUE(pass.samplerBound);
    EXPECT_EQ(pass.loadAction, LoadAction::Clear);
    EXPECT_EQ(pass.clearColor.a, 1.0f);
    EXPECT_EQ(pass.clearColor.r, 0.0f);
    EXPECT_EQ(pass.debugName, "mipmap renderPass " + std::to_string(i + 1));
    EXPECT_EQ(pass.commandBufferName, "mip gen encoder");
  }
}

TEST_F(MipGeneratorTest, ResourceFailureEncodesNothing) {
  generator_.reset();
  cache_.reset();
  config_.framebufferLimit = 3;
  resetContext();
  initContext();
  createGenerator();
  auto texture = createTexture(TextureFormat::RGBA_UNorm8, 256, 256, 9);

  Result ret;
  const auto generation = generator_->generate(texture, 0, &ret);
  EXPECT_EQ(ret.code, Result::Code::RuntimeError);
  EXPECT_EQ(generation.generatedLevels, 0u);
  EXPECT_EQ(generation.submitHandle, 0u);
  EXPECT_EQ(generation.commandBuffer, nullptr);
  EXPECT_EQ(recording_->framebuffersCreated, 3u);
  EXPECT_TRUE(recording_->passes.empty());
  EXPECT_EQ(recording_->submits, 0u);
  EXPECT_EQ(recordingDevice().getLiveBindGroupCount(), 0u);
}

TEST_F(MipGeneratorTest, OneDrawPerLevel) {
  auto texture = createTexture(TextureFormat::RGBA_UNorm8, 64, 16, 7);

  Result ret;
  const auto generation = generator_->generate(texture, 0, &ret);
  ASSERT_TRUE(ret.isOk()) << ret.message;
  ASSERT_NE(generation.commandBuffer, nullptr);
  EXPECT_EQ(generation.commandBuffer->getCurrentDrawCount(), 6u);

  auto commandQueue = context_->commandQueue();
  ASSERT_NE(commandQueue, nullptr);
  commandQueue->endFrame();
  EXPECT_EQ(commandQueue->getLastFrameDrawCount(), 6u);
}

TEST_F(MipGeneratorTest, NonSquareStopsWhenBothAxesReachOne) {
  auto texture = createTexture(TextureFormat::RGBA_UNorm8, 256, 1, 9);

  Result ret;
  const auto generation = generator_->generate(texture, 20, &ret);
  ASSERT_TRUE(ret.isOk()) << ret.message;
  EXPECT_EQ(generation.generatedLevels, 8u);
  ASSERT_FALSE(recording_->passes.empty());
  EXPECT_EQ(recording_->passes.back().targetWidth, 1u);
  EXPECT_EQ(recording_->passes.back().targetHeight, 1u);
  EXPECT_EQ(recording_->passes.back().targetLevel, 8u);
}

TEST_F(MipGeneratorTest, PartialChain) {
  auto texture = createTexture(TextureFormat::RGBA_UNorm8, 64, 64, 7);

  Result ret;
  const auto generation = generator_->generate(texture, 3, &ret);
  ASSERT_TRUE(ret.isOk());
  EXPECT_EQ(generation.generatedLevels, 2u);
  ASSERT_EQ(recording_->passes.size(), 2u);
  EXPECT_EQ(recording_->passes[1].targetLevel, 2u);
}

TEST_F(MipGeneratorTest, DefaultLevelCountIsClampedToAllocation) {
  auto texture = createTexture(TextureFormat::RGBA_UNorm8, 64, 64, 3);

  Result ret;
  const auto generation = generator_->generate(texture, 0, &ret);
  ASSERT_TRUE(ret.isOk());
  EXPECT_EQ(generation.generatedLevels, 2u);
}

TEST_F(MipGeneratorTest, SingleLevelSubmitsNothing) {
  auto texture = createTexture(TextureFormat::RGBA_UNorm8, 1, 1, 1);

  Result ret;
  const auto generation = generator_->generate(texture, 0, &ret);
  EXPECT_TRUE(ret.isOk());
  EXPECT_EQ(generation.generatedLevels, 0u);
  EXPECT_EQ(generation.submitHandle, 0u);
  EXPECT_EQ(generation.commandBuffer, nullptr);
  EXPECT_EQ(recording_->submits, 0u);
}

TEST_F(MipGeneratorTest, UnclampedRequestOutOfRange) {
  engine::MipGeneratorDesc desc;
  desc.clampLevelCount = false;
  createGenerator(desc);
  auto texture = createTexture(TextureFormat::RGBA_UNorm8, 64, 64, 3);

  Result ret;
  generator_->generate(texture, 7, &ret);
  EXPECT_EQ(ret.code, Result::Code::ArgumentOutOfRange);
  EXPECT_TRUE(recording_->passes.empty());
}

TEST_F(MipGeneratorTest, RequiresAttachmentUsage) {
  auto texture = createTexture(
      TextureFormat::RGBA_UNorm8, 32, 32, 6, TextureDesc::TextureUsageBits::Sampled);

  Result ret;
  generator_->generate(texture, 0, &ret);
  EXPECT_EQ(ret.code, Result::Code::ArgumentInvalid);
  EXPECT_TRUE(recording_->passes.empty());
}

TEST_F(MipGeneratorTest, NullTexture) {
  Result ret;
  generator_->generate(nullptr, 0, &ret);
  EXPECT_EQ(ret.code, Result::Code::ArgumentNull);
}

TEST_F(MipGeneratorTest, UnsupportedFormatFailsBeforeRecording) {
  auto texture = createTexture(TextureFormat::RGBA_UInt32, 32, 32, 6);

  Result ret;
  const auto generation = generator_->generate(texture, 0, &ret);
  EXPECT_EQ(ret.code, Result::Code::UnsupportedFormat);
  EXPECT_EQ(generation.generatedLevels, 0u);
  EXPECT_TRUE(recording_->passes.empty());
  EXPECT_EQ(recording_->submits, 0u);
  EXPECT_EQ(cache_->size(), 0u);
}

TEST_F(MipGeneratorTest, ProgramIsReusedAcrossCalls) {
  auto first = createTexture(TextureFormat::RGBA_UNorm8, 32, 32, 6);
  auto second = createTexture(TextureFormat::RGBA_UNorm8, 8, 4, 4);

  ASSERT_EQ(generator_->generate(first).generatedLevels, 5u);
  ASSERT_EQ(generator_->generate(second).generatedLevels, 3u);
  EXPECT_EQ(cache_->size(), 1u);
  EXPECT_EQ(recording_->pipelinesCreated.load(), 1u);
  EXPECT_EQ(recording_->submits, 2u);
}

TEST_F(MipGeneratorTest, PassResourcesAreReleased) {
  auto texture = createTexture(TextureFormat::RGBA_UNorm8, 32, 32, 6);
  generator_->generate(texture);
  EXPECT_EQ(recordingDevice().getLiveBindGroupCount(), 0u);
}

TEST_F(MipGeneratorTest, CustomLabelsAndClearColor) {
  engine::MipGeneratorDesc desc;
  desc.clearColor = Color(1.0f, 0.0f, 0.0f, 0.5f);
  desc.commandBufferLabel = "custom buffer";
  desc.renderPassLabel = "custom pass";
  createGenerator(desc);
  auto texture = createTexture(TextureFormat::RGBA_UNorm8, 4, 4, 3);

  generator_->generate(texture);
  ASSERT_EQ(recording_->passes.size(), 2u);
  EXPECT_EQ(recording_->passes[0].debugName, "custom pass 1");
  EXPECT_EQ(recording_->passes[0].commandBufferName, "custom buffer");
  EXPECT_EQ(recording_->passes[0].clearColor.r, 1.0f);
  EXPECT_EQ(recording_->passes[0].clearColor.a, 0.5f);
}

TEST_F(MipGeneratorTest, GenerateIntoView) {
  auto texture = createTexture(TextureFormat::RGBA_UNorm8, 32, 32, 6);
  TextureViewDesc viewDesc;
  viewDesc.mipLevel = 2;
  viewDesc.numMipLevels = 4;
  auto view = context_->device()->createTextureView(texture, viewDesc, nullptr);
  ASSERT_NE(view, nullptr);

  Result ret;
  const auto generation = generator_->generate(view, 0, &ret);
  ASSERT_TRUE(ret.isOk()) << ret.message;
  // The view is 8x8 with 4 levels.
  EXPECT_EQ(generation.generatedLevels, 3u);
  ASSERT_EQ(recording_->passes.size(), 3u);
  EXPECT_EQ(recording_->passes[0].sourceLevel, 2);
  EXPECT_EQ(recording_->passes[0].targetLevel, 3u);
  EXPECT_EQ(recording_->passes[2].targetLevel, 5u);
}

} // namespace mipgen::tests
