#include <gtest/gtest.h>

#include <string>

#include "openmelee/core/result.hpp"
#include "openmelee/version.hpp"

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(openmelee::Version::major, 0);
    EXPECT_EQ(openmelee::Version::minor, 3);
    EXPECT_EQ(openmelee::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(openmelee::Version::string, "0.3.0");
}

TEST(ResultTest, OkValue) {
    auto result = openmelee::Result<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValue) {
    auto result = openmelee::Result<int>::err(openmelee::Error("something failed"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "something failed");
    EXPECT_EQ(result.error().code, -1);
}

TEST(ResultTest, ErrorWithCode) {
    auto result = openmelee::Result<int>::err(openmelee::Error(404, "not found"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, 404);
    EXPECT_EQ(result.error().message, "not found");
}

TEST(ResultTest, ValueOr) {
    auto ok = openmelee::Result<int>::ok(10);
    auto err = openmelee::Result<int>::err(openmelee::Error("fail"));
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
}

TEST(ResultTest, MoveOutValue) {
    auto result = openmelee::Result<std::string>::ok("TEST#001");
    std::string code = std::move(result).value();
    EXPECT_EQ(code, "TEST#001");
}

TEST(ResultTest, VoidSpecialization) {
    auto ok = openmelee::Result<void>::ok();
    EXPECT_TRUE(ok);

    auto err = openmelee::Result<void>::err(openmelee::Error("boom"));
    EXPECT_FALSE(err);
    EXPECT_EQ(err.error().message, "boom");
}
