#pragma once

#include <string>
#include <string_view>

namespace seed {

// Normalize an archive entry path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
// - drop a trailing "/" (directory entries)
inline std::string NormalizeArchivePath(std::string s) {
    while (s.rfind("./", 0) == 0 || (!s.empty() && s.front() == '/')) {
        s.erase(0, s.front() == '/' ? 1 : 2);
    }

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

inline std::string_view TrimSpaces(std::string_view s) {
    constexpr std::string_view kSpace = " \t\r\n";
    const auto b = s.find_first_not_of(kSpace);
    if (b == std::string_view::npos) return {};
    const auto e = s.find_last_not_of(kSpace);
    return s.substr(b, e - b + 1);
}

} // namespace seed
