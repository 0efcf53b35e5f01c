/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <mipgen/Common.h>

namespace mipgen::tests {

TEST(CommonTest, BackendTypeToStringTest) {
  ASSERT_EQ(BackendTypeToString(BackendType::Invalid), "Invalid");
  ASSERT_EQ(BackendTypeToString(BackendType::OpenGL), "OpenGL");
  ASSERT_EQ(BackendTypeToString(BackendType::Custom), "Custom");
}

TEST(CommonTest, ResultCodeToStringTest) {
  ASSERT_EQ(ResultCodeToString(Result::Code::Ok), "Ok");
  ASSERT_EQ(ResultCodeToString(Result::Code::NotInitialized), "NotInitialized");
  ASSERT_EQ(ResultCodeToString(Result::Code::NoAdapter), "NoAdapter");
  ASSERT_EQ(ResultCodeToString(Result::Code::NoDevice), "NoDevice");
  ASSERT_EQ(ResultCodeToString(Result::Code::UnsupportedFormat), "UnsupportedFormat");
}

TEST(CommonTest, ResultTest) {
  Result testResult;
  Result testResult2(Result::Code::Ok, "test message2");
  Result testResult3(Result::Code::Ok, std::string("test message3"));
  ASSERT_STREQ(testResult2.message.c_str(), "test message2");
  ASSERT_TRUE(testResult2.isOk());
  ASSERT_STREQ(testResult3.message.c_str(), "test message3");
  ASSERT_TRUE(testResult3.isOk());

  Result::setResult(&testResult, Result::Code::ArgumentInvalid, std::string("new test message"));
  ASSERT_STREQ(testResult.message.c_str(), "new test message");
  ASSERT_FALSE(testResult.isOk());

  Result::setResult(&testResult3, testResult);
  ASSERT_FALSE(testResult3.isOk());

  Result::setResult(&testResult2, std::move(testResult));
  ASSERT_FALSE(testResult2.isOk());

  Result::setOk(&testResult2);
  ASSERT_TRUE(testResult2.isOk());
  ASSERT_TRUE(testResult2.message.empty());

  // Null out-pointers are ignored.
  Result::setResult(nullptr, Result::Code::RuntimeError);
  Result::setOk(nullptr);
}

TEST(CommonTest, NullResultMessage) {
  const Result result(Result::Code::RuntimeError, static_cast<const char*>(nullptr));
  ASSERT_TRUE(result.message.empty());
}

TEST(CommonTest, DimensionsAtLevel) {
  const Dimensions base{256, 64};
  ASSERT_EQ(base.atLevel(0), base);
  ASSERT_EQ(base.atLevel(2), (Dimensions{64, 16}));
  // the short side stops shrinking at 1
  ASSERT_EQ(base.atLevel(7), (Dimensions{2, 1}));
  ASSERT_EQ(base.atLevel(8), (Dimensions{1, 1}));
  ASSERT_EQ(base.atLevel(40), (Dimensions{1, 1}));
  ASSERT_NE(base, (Dimensions{64, 256}));
}

} // namespace mipgen::tests
