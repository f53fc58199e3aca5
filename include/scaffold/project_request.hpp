#pragma once

#include "scaffold/metadata.hpp"
#include "util/result.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace seed {

// Choices that make up one generation request.
struct ProjectInfo {
    std::string name;
    std::string group_id;
    std::string artifact_id;
    std::string description;

    std::string project_type;
    std::string language;
    std::string boot_version;
    std::string packaging;
    std::string java_version;

    std::vector<std::string> dependencies;
};

// Non-empty after trimming and free of spaces.
Result ValidateIdentifier(std::string_view value, std::string_view field);

// Trims the choices, fills empty ones from the metadata defaults and checks
// every choice against the catalog, including dependency compatibility with
// the selected boot version.
std::expected<ProjectInfo, std::string> ResolveProjectInfo(ProjectInfo info,
                                                           const InitializrMetadata& metadata);

// application/x-www-form-urlencoded body for the generator's starter endpoint.
std::string EncodeStarterForm(const ProjectInfo& info);

std::string FormUrlEncode(std::string_view value);

// "a,b , c" -> {"a", "b", "c"}
std::vector<std::string> SplitList(std::string_view text);

} // namespace seed
