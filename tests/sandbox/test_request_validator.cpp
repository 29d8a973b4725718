/*
 * test_request_validator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_request_validator.cpp
 * @brief Tests for request shape and limit checks
 */

#include <gtest/gtest.h>
#include "sandbox/request_validator.hpp"

#include <string>

using namespace warden::sandbox;

class RequestValidatorTest : public ::testing::Test {
protected:
    RequestValidator validator_{warden::config::LimitsConfig{}};

    static ExecutionRequest request(std::string code) {
        ExecutionRequest req;
        req.code = std::move(code);
        return req;
    }
};

TEST_F(RequestValidatorTest, IsBlank) {
    EXPECT_TRUE(isBlank(""));
    EXPECT_TRUE(isBlank(" \t\n\r\f\v"));
    EXPECT_FALSE(isBlank("  x "));
}

TEST_F(RequestValidatorTest, AcceptsSimpleRequest) {
    EXPECT_TRUE(validator_.validate(request("print('hi')")).has_value());
}

TEST_F(RequestValidatorTest, RejectsEmptyAndBlankCode) {
    EXPECT_EQ(validator_.validate(request("")).error(), RequestError::EmptyCode);
    EXPECT_EQ(validator_.validate(request("   \n\t")).error(),
              RequestError::WhitespaceOnlyCode);
}

TEST_F(RequestValidatorTest, CodeLengthBoundary) {
    EXPECT_TRUE(validator_.validate(request(std::string(50000, 'x'))).has_value());
    EXPECT_EQ(validator_.validate(request(std::string(50001, 'x'))).error(),
              RequestError::CodeTooLong);
}

TEST_F(RequestValidatorTest, CodeLengthCountsCharacters) {
    // 20000 three-byte characters are 60000 bytes but only 20000 characters
    std::string text;
    for (int i = 0; i < 20000; ++i) {
        text += "\xE2\x82\xAC";
    }
    EXPECT_TRUE(validator_.validate(request("s = '" + text + "'")).has_value());
}

TEST_F(RequestValidatorTest, TimeoutBounds) {
    auto req = request("pass");
    req.timeoutSeconds = 1;
    EXPECT_TRUE(validator_.validate(req).has_value());
    req.timeoutSeconds = 300;
    EXPECT_TRUE(validator_.validate(req).has_value());
    req.timeoutSeconds = 0;
    EXPECT_EQ(validator_.validate(req).error(), RequestError::TimeoutOutOfRange);
    req.timeoutSeconds = 301;
    EXPECT_EQ(validator_.validate(req).error(), RequestError::TimeoutOutOfRange);
    req.timeoutSeconds = -5;
    EXPECT_EQ(validator_.validate(req).error(), RequestError::TimeoutOutOfRange);
}

TEST_F(RequestValidatorTest, MemoryBounds) {
    auto req = request("pass");
    req.maxMemoryMB = 64;
    EXPECT_TRUE(validator_.validate(req).has_value());
    req.maxMemoryMB = 2048;
    EXPECT_TRUE(validator_.validate(req).has_value());
    req.maxMemoryMB = 63;
    EXPECT_EQ(validator_.validate(req).error(), RequestError::MemoryOutOfRange);
    req.maxMemoryMB = 2049;
    EXPECT_EQ(validator_.validate(req).error(), RequestError::MemoryOutOfRange);
}

TEST_F(RequestValidatorTest, EffectiveDefaults) {
    auto req = request("pass");
    EXPECT_EQ(validator_.effectiveTimeout(req), 30);
    EXPECT_EQ(validator_.effectiveMemoryMB(req), 512);
    req.timeoutSeconds = 5;
    req.maxMemoryMB = 100;
    EXPECT_EQ(validator_.effectiveTimeout(req), 5);
    EXPECT_EQ(validator_.effectiveMemoryMB(req), 100);
}

TEST_F(RequestValidatorTest, RejectsNonObjectNamespaces) {
    auto req = request("pass");
    req.globals = json::array();
    EXPECT_EQ(validator_.validate(req).error(), RequestError::InvalidGlobals);
    req.globals = json::object();
    req.locals = "text";
    EXPECT_EQ(validator_.validate(req).error(), RequestError::InvalidLocals);
}

TEST_F(RequestValidatorTest, ParseCombinesShapeAndLimits) {
    auto ok = validator_.parse({{"code", "x = 1"}, {"timeout_seconds", 10}});
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok->timeoutSeconds, 10);

    EXPECT_EQ(validator_.parse({{"code", "x"}, {"timeout_seconds", 1000}}).error(),
              RequestError::TimeoutOutOfRange);
    EXPECT_EQ(validator_.parse({{"code", " "}}).error(), RequestError::WhitespaceOnlyCode);
    EXPECT_EQ(validator_.parse(json("code")).error(), RequestError::MalformedRequest);
}

TEST_F(RequestValidatorTest, CustomLimits) {
    warden::config::LimitsConfig limits;
    limits.maxCodeLength = 10;
    limits.timeoutMaxSeconds = 5;
    limits.timeoutDefaultSeconds = 2;
    RequestValidator validator(limits);

    EXPECT_EQ(validator.validate(request("x = 123456789")).error(), RequestError::CodeTooLong);
    auto req = request("pass");
    req.timeoutSeconds = 6;
    EXPECT_EQ(validator.validate(req).error(), RequestError::TimeoutOutOfRange);
    EXPECT_EQ(validator.limits().timeoutMaxSeconds, 5);
}
