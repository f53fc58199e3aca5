#include "scaffold/metadata.hpp"

#include <algorithm>

namespace seed {

const SelectOption* SelectField::Find(const std::string& id) const {
    auto it = std::find_if(options.begin(), options.end(),
                           [&](const SelectOption& o) { return o.id == id; });
    return it == options.end() ? nullptr : &*it;
}

const ComponentDescriptor* InitializrMetadata::FindDependency(const std::string& id) const {
    auto it = std::find_if(dependencies.begin(), dependencies.end(),
                           [&](const ComponentDescriptor& c) { return c.id == id; });
    return it == dependencies.end() ? nullptr : &*it;
}

} // namespace seed
