#include "sample_metadata.hpp"
#include "scaffold/metadata_parser.hpp"
#include "scaffold/project_request.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace seed {
namespace {

class ProjectRequestTest : public ::testing::Test {
  protected:
    void SetUp() override {
        auto md = MetadataParser().Parse(testutil::kSampleMetadata);
        ASSERT_TRUE(md.has_value()) << md.error();
        metadata_ = std::move(*md);
    }

    InitializrMetadata metadata_;
};

TEST(ProjectRequestValidationTest, IdentifierRules) {
    EXPECT_TRUE(ValidateIdentifier("demo", "name").ok);
    EXPECT_TRUE(ValidateIdentifier("  demo  ", "name").ok);

    auto empty = ValidateIdentifier("   ", "name");
    ASSERT_FALSE(empty.ok);
    EXPECT_EQ(empty.msg, "name should not be empty");

    auto spaced = ValidateIdentifier("my demo", "group id");
    ASSERT_FALSE(spaced.ok);
    EXPECT_EQ(spaced.msg, "group id should not contain space");
}

TEST_F(ProjectRequestTest, EmptyChoicesTakeMetadataDefaults) {
    auto info = ResolveProjectInfo(ProjectInfo{}, metadata_);
    ASSERT_TRUE(info.has_value()) << info.error();

    EXPECT_EQ(info->name, "demo");
    EXPECT_EQ(info->group_id, "com.example");
    EXPECT_EQ(info->artifact_id, "demo");
    // free text: left empty, the generator applies its own default
    EXPECT_TRUE(info->description.empty());
    EXPECT_EQ(info->project_type, "maven-project");
    EXPECT_EQ(info->language, "java");
    EXPECT_EQ(info->boot_version, "3.2.1");
    EXPECT_EQ(info->packaging, "jar");
    EXPECT_EQ(info->java_version, "17");
    EXPECT_TRUE(info->dependencies.empty());
    EXPECT_NE(EncodeStarterForm(*info).find("&description=&language=java&"), std::string::npos);
}

TEST_F(ProjectRequestTest, TrimsAndDeduplicatesDependencies) {
    ProjectInfo in;
    in.name = "  shop  ";
    in.dependencies = {" web", "lombok ", "web", ""};

    auto info = ResolveProjectInfo(in, metadata_);
    ASSERT_TRUE(info.has_value()) << info.error();
    EXPECT_EQ(info->name, "shop");
    EXPECT_EQ(info->dependencies, (std::vector<std::string>{"web", "lombok"}));
}

TEST_F(ProjectRequestTest, RejectsInvalidChoices) {
    struct Case {
        ProjectInfo info;
        std::string expected_error_substr;
    };
    std::vector<Case> cases;
    {
        ProjectInfo p;
        p.name = "my shop";
        cases.push_back({p, "name should not contain space"});
    }
    {
        ProjectInfo p;
        p.language = "scala";
        cases.push_back({p, "unknown language 'scala'"});
    }
    {
        ProjectInfo p;
        p.project_type = "maven-build";
        cases.push_back({p, "unknown project type"});
    }
    {
        ProjectInfo p;
        p.dependencies = {"does-not-exist"};
        cases.push_back({p, "unknown dependency 'does-not-exist'"});
    }
    {
        ProjectInfo p;
        p.boot_version = "3.2.1";
        p.dependencies = {"hilla"};
        cases.push_back({p, "requires >=3.1.0 and <3.2.0"});
    }

    for (const auto& c : cases) {
        auto res = ResolveProjectInfo(c.info, metadata_);
        ASSERT_FALSE(res.has_value()) << c.expected_error_substr;
        EXPECT_NE(res.error().find(c.expected_error_substr), std::string::npos) << res.error();
    }
}

TEST_F(ProjectRequestTest, CompatibilityFollowsChosenBootVersion) {
    ProjectInfo p;
    p.boot_version = "3.1.7";
    p.dependencies = {"hilla", "native"};
    auto info = ResolveProjectInfo(p, metadata_);
    ASSERT_TRUE(info.has_value()) << info.error();
    EXPECT_EQ(info->dependencies, (std::vector<std::string>{"hilla", "native"}));
}

TEST(FormEncodingTest, EscapesReservedCharacters) {
    EXPECT_EQ(FormUrlEncode("abc-XYZ_0.9~"), "abc-XYZ_0.9~");
    EXPECT_EQ(FormUrlEncode("Demo project"), "Demo+project");
    EXPECT_EQ(FormUrlEncode("a&b=c,d/e"), "a%26b%3Dc%2Cd%2Fe");
    EXPECT_EQ(FormUrlEncode("\xC3\xA9"), "%C3%A9");
}

TEST(FormEncodingTest, EncodesStarterFormInFieldOrder) {
    ProjectInfo info;
    info.name = "demo";
    info.group_id = "com.example";
    info.artifact_id = "demo";
    info.description = "Demo project";
    info.language = "java";
    info.java_version = "17";
    info.boot_version = "3.2.1";
    info.project_type = "maven-project";
    info.packaging = "jar";
    info.dependencies = {"web", "lombok"};

    EXPECT_EQ(EncodeStarterForm(info),
              "name=demo&groupId=com.example&artifactId=demo&description=Demo+project"
              "&language=java&javaVersion=17&bootVersion=3.2.1&type=maven-project"
              "&packaging=jar&dependencies=web%2Clombok");
}

TEST(FormEncodingTest, SplitsDependencyLists) {
    EXPECT_EQ(SplitList("web, lombok ,,devtools"),
              (std::vector<std::string>{"web", "lombok", "devtools"}));
    EXPECT_TRUE(SplitList("").empty());
    EXPECT_TRUE(SplitList(" , ").empty());
}

} // namespace
} // namespace seed
