#pragma once

#include "util/semantic_version.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace seed {

// Range of platform versions an add-on component supports.
//
// An absent bound places no constraint on that side; with both bounds
// absent the interval contains every version. An inclusivity flag only
// matters when its bound is present.
struct VersionInterval {
    std::optional<SemanticVersion> lower;
    std::optional<SemanticVersion> upper;
    bool lower_inclusive = false;
    bool upper_inclusive = false;

    bool IsUniversal() const { return !lower && !upper; }

    bool Contains(const SemanticVersion& candidate) const;

    // ">=3.2.0 and <4.0.0". Empty when there is no lower bound. Display only,
    // the output is not meant to be parsed back.
    std::string Render() const;
};

enum class IntervalParseStatus {
    Exact,
    Degraded,  // malformed input, unusable pieces were dropped
};

struct IntervalParseResult {
    VersionInterval interval;
    IntervalParseStatus status = IntervalParseStatus::Exact;
    std::string reason;

    bool degraded() const { return status == IntervalParseStatus::Degraded; }
};

// Reads interval notation:
//   ""                 every version
//   "3.2.0"            [3.2.0, unbounded)
//   "[1.0.0,2.0.0)"    '[' / ']' inclusive, '(' / ')' exclusive
//   "(,2.0.0]"         either side may be left empty
// Never fails: a bound that is not a valid version is dropped and the
// result is tagged Degraded.
IntervalParseResult ParseVersionInterval(std::string_view raw);

} // namespace seed
