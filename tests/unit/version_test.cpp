#include <gtest/gtest.h>

#include <memory>
#include <string>

// POSIX declares a brk() function here; the project namespace must not clash.
#include <unistd.h>

#include "brk/brk.hpp"

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(breakout::Version::major, 0);
    EXPECT_EQ(breakout::Version::minor, 1);
    EXPECT_EQ(breakout::Version::patch, 0);
}

TEST(VersionTest, NamespaceCoexistsWithPosixHeaders) {
    using Fn = int (*)(void*);
    Fn posixBrk = &::brk;
    EXPECT_NE(posixBrk, nullptr);
    EXPECT_EQ(breakout::Version::major, BRK_VERSION_MAJOR);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(breakout::Version::string, "0.1.0");
}

TEST(ResultTest, OkValue) {
    auto result = breakout::Result<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValue) {
    auto result = breakout::Result<int>::err(breakout::Error("something failed"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "something failed");
    EXPECT_EQ(result.error().code, -1);
}

TEST(ResultTest, ErrorWithCode) {
    auto result = breakout::Result<int>::err(breakout::Error(404, "not found"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, 404);
    EXPECT_EQ(result.error().message, "not found");
}

TEST(ResultTest, ValueOr) {
    auto ok = breakout::Result<int>::ok(10);
    auto err = breakout::Result<int>::err(breakout::Error("fail"));
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
}

TEST(ResultTest, SameValueAndErrorTypeStaysDistinct) {
    auto ok = breakout::Result<std::string, std::string>::ok("value");
    auto err = breakout::Result<std::string, std::string>::err("error");
    EXPECT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value(), "value");
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.error(), "error");
}

TEST(ResultTest, MoveOnlyValueCanBeTaken) {
    auto result = breakout::Result<std::unique_ptr<int>>::ok(std::make_unique<int>(7));
    auto owned = std::move(result).value();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 7);
}

TEST(ResultVoidTest, Ok) {
    auto result = breakout::Result<void>::ok();
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
}

TEST(ResultVoidTest, Error) {
    auto result = breakout::Result<void>::err(breakout::Error("void error"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "void error");
}
