#include <gtest/gtest.h>
#include <JdkManager/Utils/PathSafety.hpp>

using JdkManager::Utils::isSafeRelativePath;

namespace {

TEST(PathSafetyTest, AcceptsNestedRelativeNames) {
    EXPECT_TRUE(isSafeRelativePath("jdk-17.0.2+8/bin/java"));
    EXPECT_TRUE(isSafeRelativePath("jdk-17.0.2+8/lib/..hidden"));
}

TEST(PathSafetyTest, RejectsEscapes) {
    EXPECT_FALSE(isSafeRelativePath(""));
    EXPECT_FALSE(isSafeRelativePath("/etc/passwd"));
    EXPECT_FALSE(isSafeRelativePath("\\Windows\\System32"));
    EXPECT_FALSE(isSafeRelativePath("C:\\jdk\\bin"));
    EXPECT_FALSE(isSafeRelativePath("../escaped.txt"));
    EXPECT_FALSE(isSafeRelativePath("jdk/../../escaped.txt"));
    EXPECT_FALSE(isSafeRelativePath("jdk\\..\\escaped.txt"));
}

} // namespace
