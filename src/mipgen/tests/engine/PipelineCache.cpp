/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "EngineTestBase.h"

#include <mipgen/engine/PipelineCache.h>
#include <thread>
#include <vector>

namespace mipgen::tests {

class PipelineCacheTest : public EngineTestBase {
 public:
  void SetUp() override {
    EngineTestBase::SetUp();
    initContext();
    cache_ = std::make_unique<engine::PipelineCache>(*context_);
  }

  void TearDown() override {
    cache_.reset();
    EngineTestBase::TearDown();
  }

 protected:
  std::unique_ptr<engine::PipelineCache> cache_;
};

TEST_F(PipelineCacheTest, SameFormatReturnsSameProgram) {
  Result ret;
  auto first = cache_->getProgram(TextureFormat::RGBA_UNorm8, &ret);
  ASSERT_TRUE(ret.isOk()) << ret.message;
  ASSERT_NE(first, nullptr);
  auto second = cache_->getProgram(TextureFormat::RGBA_UNorm8, &ret);
  ASSERT_TRUE(ret.isOk());

  EXPECT_EQ(first, second);
  EXPECT_EQ(cache_->size(), 1u);
  EXPECT_EQ(recording_->pipelinesCreated.load(), 1u);
  EXPECT_EQ(recording_->shaderModulesCreated.load(), 2u);
}

TEST_F(PipelineCacheTest, DistinctFormatsGetDistinctPrograms) {
  auto rgba = cache_->getProgram(TextureFormat::RGBA_UNorm8);
  auto half = cache_->getProgram(TextureFormat::RGBA_F16);
  ASSERT_NE(rgba, nullptr);
  ASSERT_NE(half, nullptr);

  EXPECT_NE(rgba, half);
  EXPECT_EQ(rgba->format(), TextureFormat::RGBA_UNorm8);
  EXPECT_EQ(half->format(), TextureFormat::RGBA_F16);
  EXPECT_TRUE(cache_->contains(TextureFormat::RGBA_UNorm8));
  EXPECT_TRUE(cache_->contains(TextureFormat::RGBA_F16));
  EXPECT_FALSE(cache_->contains(TextureFormat::R_UNorm8));
  EXPECT_EQ(cache_->size(), 2u);
}

TEST_F(PipelineCacheTest, ProgramTargetsRequestedFormat) {
  auto program = cache_->getProgram(TextureFormat::RGBA_SRGB);
  ASSERT_NE(program, nullptr);
  ASSERT_NE(program->pipeline(), nullptr);
  ASSERT_NE(program->shaderStages(), nullptr);

  const auto& desc = program->pipeline()->getRenderPipelineDesc();
  ASSERT_EQ(desc.targetDesc.colorAttachments.size(), 1u);
  EXPECT_EQ(desc.targetDesc.colorAttachments[0].textureFormat, TextureFormat::RGBA_SRGB);
  EXPECT_NE(desc.debugName.find("mipmap pipeline RGBA_SRGB"), std::string::npos);
  EXPECT_EQ(program->sourceUnit(), 0u);
}

TEST_F(PipelineCacheTest, IntegerFormatIsUnsupported) {
  Result ret;
  auto program = cache_->getProgram(TextureFormat::RGBA_UInt32, &ret);
  EXPECT_EQ(program, nullptr);
  EXPECT_EQ(ret.code, Result::Code::UnsupportedFormat);
  EXPECT_EQ(cache_->size(), 0u);
  EXPECT_EQ(recording_->pipelinesCreated.load(), 0u);
}

TEST_F(PipelineCacheTest, DepthFormatIsUnsupported) {
  Result ret;
  EXPECT_EQ(cache_->getProgram(TextureFormat::Z_UNorm24, &ret), nullptr);
  EXPECT_EQ(ret.code, Result::Code::UnsupportedFormat);
  EXPECT_EQ(cache_->size(), 0u);
}

TEST_F(PipelineCacheTest, FormatWithoutRenderingIsUnsupported) {
  cache_.reset();
  config_.formatCapabilities[TextureFormat::RGBA_F32] =
      ICapabilities::TextureFormatCapabilityBits::Sampled |
      ICapabilities::TextureFormatCapabilityBits::SampledFiltered;
  resetContext();
  initContext();
  cache_ = std::make_unique<engine::PipelineCache>(*context_);

  Result ret;
  EXPECT_EQ(cache_->getProgram(TextureFormat::RGBA_F32, &ret), nullptr);
  EXPECT_EQ(ret.code, Result::Code::UnsupportedFormat);
  EXPECT_EQ(cache_->size(), 0u);
  EXPECT_FALSE(engine::PipelineCache::isFormatSupported(*context_->device(),
                                                        TextureFormat::RGBA_F32));
  EXPECT_TRUE(engine::PipelineCache::isFormatSupported(*context_->device(),
                                                       TextureFormat::RGBA_F16));
}

TEST_F(PipelineCacheTest, CompileFailureCachesNothing) {
  cache_.reset();
  config_.failShaderCompile = true;
  resetContext();
  initContext();
  cache_ = std::make_unique<engine::PipelineCache>(*context_);

  Result ret;
  EXPECT_EQ(cache_->getProgram(TextureFormat::RGBA_UNorm8, &ret), nullptr);
  EXPECT_EQ(ret.code, Result::Code::RuntimeError);
  EXPECT_FALSE(cache_->contains(TextureFormat::RGBA_UNorm8));
}

TEST_F(PipelineCacheTest, RequiresInitializedContext) {
  cache_.reset();
  resetContext();
  cache_ = std::make_unique<engine::PipelineCache>(*context_);

  Result ret;
  EXPECT_EQ(cache_->getProgram(TextureFormat::RGBA_UNorm8, &ret), nullptr);
  EXPECT_EQ(ret.code, Result::Code::NotInitialized);
  EXPECT_EQ(cache_->size(), 0u);
}

TEST_F(PipelineCacheTest, ConcurrentRequestsShareOneEntry) {
  constexpr size_t kThreads = 8;
  std::vector<std::shared_ptr<engine::ShaderProgram>> programs(kThreads);
  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (size_t i = 0; i < kThreads; ++i) {
    threads.emplace_back([this, &programs, i] {
      programs[i] = cache_->getProgram(TextureFormat::RGBA_UNorm8);
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(cache_->size(), 1u);
  for (const auto& program : programs) {
    ASSERT_NE(program, nullptr);
    EXPECT_EQ(program, programs.front());
  }
  // Losers of the race compile too, but only one program is kept.
  EXPECT_GE(recording_->pipelinesCreated.load(), 1u);
  EXPECT_LE(recording_->pipelinesCreated.load(), kThreads);
}

} // namespace mipgen::tests
