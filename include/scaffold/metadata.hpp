#pragma once

#include "scaffold/version_interval.hpp"

#include <map>
#include <string>
#include <vector>

namespace seed {

struct SelectOption {
    std::string id;
    std::string name;
    std::string description;
    std::map<std::string, std::string> tags;  // e.g. "format" -> "project"
};

struct SelectField {
    std::string default_id;
    std::vector<SelectOption> options;

    const SelectOption* Find(const std::string& id) const;
};

struct TextField {
    std::string default_value;
};

// Add-on component (a generator "dependency") and the platform versions it supports.
struct ComponentDescriptor {
    std::string id;
    std::string name;
    std::string description;
    std::string group;

    std::string raw_range;
    VersionInterval compatibility;
    bool range_degraded = false;
};

// Decoded client metadata of the project generator.
struct InitializrMetadata {
    SelectField language;
    SelectField java_version;
    SelectField boot_version;
    SelectField packaging;
    SelectField project_type;

    TextField group_id;
    TextField artifact_id;
    TextField name;
    TextField description;
    TextField package_name;
    TextField version;

    std::vector<ComponentDescriptor> dependencies;

    const ComponentDescriptor* FindDependency(const std::string& id) const;
};

} // namespace seed
