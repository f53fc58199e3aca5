#pragma once

#include "scaffold/metadata.hpp"
#include "util/semantic_version.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace seed {

// Components whose compatibility interval contains platform_version, in catalog order.
std::vector<ComponentDescriptor> ComputeOfferedOptions(const std::vector<ComponentDescriptor>& all,
                                                       const SemanticVersion& platform_version);

// As above for an unparsed version. A version that does not parse only
// keeps the components that declare no range at all.
std::vector<ComponentDescriptor> ComputeOfferedOptions(const std::vector<ComponentDescriptor>& all,
                                                       std::string_view platform_version);

// Project types the generator can produce as a whole project (tags.format == "project").
std::vector<SelectOption> ProjectTypeOptions(const SelectField& field);

// The field default when it is offered, else the first option, else "".
std::string DefaultOptionId(const std::string& default_id, const std::vector<SelectOption>& options);

} // namespace seed
