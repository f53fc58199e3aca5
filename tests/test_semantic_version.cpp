#include "util/semantic_version.hpp"

#include <gtest/gtest.h>

#include <string>

namespace seed {
namespace {

SemanticVersion V(const std::string& s) {
    auto v = SemanticVersion::Parse(s);
    if (!v) ADD_FAILURE() << "cannot parse " << s << ": " << v.error();
    return v.value_or(SemanticVersion{});
}

TEST(SemanticVersionTest, ParsesDottedNumbers) {
    auto v = SemanticVersion::Parse("3.2.1");
    ASSERT_TRUE(v.has_value()) << v.error();
    EXPECT_EQ(v->Major(), 3U);
    EXPECT_EQ(v->Minor(), 2U);
    EXPECT_EQ(v->Patch(), 1U);
    EXPECT_TRUE(v->Qualifier().empty());
    EXPECT_EQ(v->ToString(), "3.2.1");
}

TEST(SemanticVersionTest, ParsesQualifiers) {
    auto snapshot = SemanticVersion::Parse("3.3.0-SNAPSHOT");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->Qualifier(), "SNAPSHOT");
    EXPECT_FALSE(snapshot->IsRelease());

    auto legacy = SemanticVersion::Parse("2.7.18.RELEASE");
    ASSERT_TRUE(legacy.has_value());
    EXPECT_EQ(legacy->Patch(), 18U);
    EXPECT_EQ(legacy->Qualifier(), "RELEASE");
    EXPECT_TRUE(legacy->IsRelease());
}

TEST(SemanticVersionTest, MissingPartsReadAsZero) {
    EXPECT_EQ(V("3.2"), V("3.2.0"));
    EXPECT_EQ(V("3"), V("3.0.0"));
    EXPECT_EQ(V(" 1.0.0 "), V("1.0.0"));
    EXPECT_EQ(V("2.7.18.RELEASE"), V("2.7.18"));
}

TEST(SemanticVersionTest, RejectsMalformedInput) {
    const char* bad[] = {"", "   ", "abc", "v1.2.3", "1.2.x", "1.2.", "-1.0.0", "1..2",
                         "99999999999.0.0"};
    for (const char* s : bad) {
        EXPECT_FALSE(SemanticVersion::Parse(s).has_value()) << s;
    }
}

TEST(SemanticVersionTest, NumericComponentsCompareNumerically) {
    EXPECT_LT(V("3.2.9"), V("3.2.10"));
    EXPECT_LT(V("3.9.0"), V("3.10.0"));
    EXPECT_GT(V("10.0.0"), V("9.99.99"));
    EXPECT_LE(V("1.0.0"), V("1.0.0"));
    EXPECT_GE(V("1.0.1"), V("1.0.0"));
    EXPECT_NE(V("1.0.1"), V("1.0.0"));
}

TEST(SemanticVersionTest, QualifiedBuildsPrecedeTheRelease) {
    EXPECT_LT(V("3.3.0-M1"), V("3.3.0-M2"));
    EXPECT_LT(V("3.3.0-M2"), V("3.3.0-RC1"));
    EXPECT_LT(V("3.3.0-RC1"), V("3.3.0-SNAPSHOT"));
    EXPECT_LT(V("3.3.0-SNAPSHOT"), V("3.3.0"));
    EXPECT_LT(V("3.3.0.BUILD-SNAPSHOT"), V("3.3.0.RELEASE"));
    EXPECT_LT(V("3.2.9"), V("3.3.0-M1"));
    EXPECT_LT(V("3.3.0-alpha"), V("3.3.0-M1"));
}

TEST(SemanticVersionTest, QualifierNumbersCompareNumerically) {
    EXPECT_LT(V("3.3.0-RC2"), V("3.3.0-RC10"));
    EXPECT_EQ(V("3.3.0-rc1"), V("3.3.0-RC1"));
}

} // namespace
} // namespace seed
