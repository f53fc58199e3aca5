#pragma once

#include "scaffold/metadata.hpp"

#include <expected>
#include <functional>
#include <string>

namespace seed {

class MetadataParser {
  public:
    // Called once per component whose versionRange only parsed in degraded form.
    using DegradedRangeHandler =
        std::function<void(const ComponentDescriptor& component, const std::string& reason)>;

    MetadataParser() = default;
    explicit MetadataParser(DegradedRangeHandler on_degraded)
        : on_degraded_(std::move(on_degraded)) {}

    std::expected<InitializrMetadata, std::string> Parse(const std::string& json_input) const;

  private:
    DegradedRangeHandler on_degraded_;
};

} // namespace seed
