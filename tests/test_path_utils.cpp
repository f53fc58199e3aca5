#include <gtest/gtest.h>

#include "util/path_utils.hpp"

TEST(PathUtilsTest, NormalizeArchivePathCleansInput) {
    EXPECT_EQ(seed::NormalizeArchivePath("./pom.xml"), "pom.xml");
    EXPECT_EQ(seed::NormalizeArchivePath("/src//main///java"), "src/main/java");
    EXPECT_EQ(seed::NormalizeArchivePath("////././a//b"), "a/b");
    EXPECT_EQ(seed::NormalizeArchivePath("demo/.mvn/"), "demo/.mvn");
    EXPECT_EQ(seed::NormalizeArchivePath(""), "");
}

TEST(PathUtilsTest, TrimSpaces) {
    EXPECT_EQ(seed::TrimSpaces("  a b \t\n"), "a b");
    EXPECT_EQ(seed::TrimSpaces(" \r\n "), "");
    EXPECT_EQ(seed::TrimSpaces("x"), "x");
}
