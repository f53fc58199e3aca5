#include "util/semantic_version.hpp"

#include "util/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace seed {

namespace {

bool IsDigit(char c) { return c >= '0' && c <= '9'; }

std::string Upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

int QualifierRank(const std::string& upper) {
    if (upper.starts_with("BUILD-SNAPSHOT") || upper.starts_with("SNAPSHOT")) return 3;
    if (upper.starts_with("RC")) return 2;
    if (upper.starts_with("M") && upper.size() > 1 && IsDigit(upper[1])) return 1;
    return 0;
}

// Trailing number of a qualifier ("RC12" -> 12), 0 when absent.
std::uint64_t QualifierNumber(const std::string& q) {
    size_t b = q.size();
    while (b > 0 && IsDigit(q[b - 1])) --b;
    std::uint64_t v = 0;
    std::from_chars(q.data() + b, q.data() + q.size(), v);
    return v;
}

int Cmp(std::uint64_t a, std::uint64_t b) { return a < b ? -1 : (a > b ? 1 : 0); }

} // namespace

SemanticVersion::SemanticVersion(std::uint32_t major, std::uint32_t minor, std::uint32_t patch)
    : major_(major), minor_(minor), patch_(patch),
      text_(std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch)) {}

std::expected<SemanticVersion, std::string> SemanticVersion::Parse(std::string_view text) {
    const std::string_view s = TrimSpaces(text);
    if (s.empty()) {
        return std::unexpected("empty version string");
    }

    SemanticVersion v;
    std::uint32_t* parts[] = {&v.major_, &v.minor_, &v.patch_};

    const char* p = s.data();
    const char* const end = s.data() + s.size();

    for (size_t i = 0; i < 3; ++i) {
        auto [next, ec] = std::from_chars(p, end, *parts[i]);
        if (ec == std::errc::result_out_of_range) {
            return std::unexpected("version component out of range in '" + std::string(s) + "'");
        }
        if (ec != std::errc{}) {
            return std::unexpected("expected a number in '" + std::string(s) + "'");
        }
        p = next;
        if (p == end) break;

        // "1.2.3" continues with a number, anything else after the separator
        // is the qualifier ("1.2.3-M1", "1.2.3.RELEASE").
        const char sep = *p;
        if (sep != '.' && sep != '-') {
            return std::unexpected("unexpected character in '" + std::string(s) + "'");
        }
        if (p + 1 == end) {
            return std::unexpected("trailing separator in '" + std::string(s) + "'");
        }
        if (sep == '.' && i < 2 && IsDigit(p[1])) {
            ++p;
            continue;
        }
        if (!std::isalnum(static_cast<unsigned char>(p[1]))) {
            return std::unexpected("malformed qualifier in '" + std::string(s) + "'");
        }
        v.qualifier_.assign(p + 1, end);
        break;
    }

    v.text_ = std::string(s);
    return v;
}

bool SemanticVersion::IsRelease() const {
    return qualifier_.empty() || Upper(qualifier_) == "RELEASE";
}

int SemanticVersion::Compare(const SemanticVersion& other) const {
    if (int c = Cmp(major_, other.major_); c != 0) return c;
    if (int c = Cmp(minor_, other.minor_); c != 0) return c;
    if (int c = Cmp(patch_, other.patch_); c != 0) return c;

    const bool rel = IsRelease();
    const bool orel = other.IsRelease();
    if (rel || orel) {
        return rel == orel ? 0 : (rel ? 1 : -1);
    }

    const std::string q = Upper(qualifier_);
    const std::string oq = Upper(other.qualifier_);
    if (int c = Cmp(QualifierRank(q), QualifierRank(oq)); c != 0) return c;
    if (int c = Cmp(QualifierNumber(q), QualifierNumber(oq)); c != 0) return c;
    return q.compare(oq) < 0 ? -1 : (q == oq ? 0 : 1);
}

} // namespace seed
