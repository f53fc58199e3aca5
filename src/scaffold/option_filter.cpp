#include "scaffold/option_filter.hpp"

#include <algorithm>
#include <iterator>

namespace seed {

std::vector<ComponentDescriptor> ComputeOfferedOptions(const std::vector<ComponentDescriptor>& all,
                                                       const SemanticVersion& platform_version) {
    std::vector<ComponentDescriptor> out;
    std::copy_if(all.begin(), all.end(), std::back_inserter(out),
                 [&](const ComponentDescriptor& c) { return c.compatibility.Contains(platform_version); });
    return out;
}

std::vector<ComponentDescriptor> ComputeOfferedOptions(const std::vector<ComponentDescriptor>& all,
                                                       std::string_view platform_version) {
    auto v = SemanticVersion::Parse(platform_version);
    if (v) return ComputeOfferedOptions(all, *v);

    std::vector<ComponentDescriptor> out;
    std::copy_if(all.begin(), all.end(), std::back_inserter(out),
                 [](const ComponentDescriptor& c) { return c.compatibility.IsUniversal(); });
    return out;
}

std::vector<SelectOption> ProjectTypeOptions(const SelectField& field) {
    std::vector<SelectOption> out;
    for (const auto& opt : field.options) {
        auto it = opt.tags.find("format");
        if (it != opt.tags.end() && it->second == "project") {
            out.push_back(opt);
        }
    }
    return out;
}

std::string DefaultOptionId(const std::string& default_id, const std::vector<SelectOption>& options) {
    if (options.empty()) return {};
    for (const auto& opt : options) {
        if (opt.id == default_id) return default_id;
    }
    return options.front().id;
}

} // namespace seed
