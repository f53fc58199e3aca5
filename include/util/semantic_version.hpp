#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace seed {

// Dotted platform version: major[.minor[.patch]][(-|.)qualifier]
//
// Missing numeric parts read as zero, so "3.2" == "3.2.0". A release
// ("3.2.0" or "3.2.0.RELEASE") ranks above any qualified build of the same
// numbers; qualifiers rank M < RC < SNAPSHOT, unknown ones below M.
class SemanticVersion {
public:
    SemanticVersion() = default;
    SemanticVersion(std::uint32_t major, std::uint32_t minor, std::uint32_t patch);

    static std::expected<SemanticVersion, std::string> Parse(std::string_view text);

    std::uint32_t Major() const { return major_; }
    std::uint32_t Minor() const { return minor_; }
    std::uint32_t Patch() const { return patch_; }
    const std::string& Qualifier() const { return qualifier_; }
    bool IsRelease() const;

    // The text the version was parsed from, or "major.minor.patch".
    const std::string& ToString() const { return text_; }

    // <0, 0 or >0 like strcmp.
    int Compare(const SemanticVersion& other) const;

    bool operator==(const SemanticVersion& o) const { return Compare(o) == 0; }
    bool operator!=(const SemanticVersion& o) const { return Compare(o) != 0; }
    bool operator<(const SemanticVersion& o) const { return Compare(o) < 0; }
    bool operator<=(const SemanticVersion& o) const { return Compare(o) <= 0; }
    bool operator>(const SemanticVersion& o) const { return Compare(o) > 0; }
    bool operator>=(const SemanticVersion& o) const { return Compare(o) >= 0; }

private:
    std::uint32_t major_ = 0;
    std::uint32_t minor_ = 0;
    std::uint32_t patch_ = 0;
    std::string qualifier_;
    std::string text_ = "0.0.0";
};

} // namespace seed
