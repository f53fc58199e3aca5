#include "scaffold/archive_path_policy.hpp"

#include "util/path_utils.hpp"

#include <string_view>

namespace seed {

bool ArchivePathPolicy::IsSafeRelativePath(const std::string& p) {
    if (p.empty()) return false;
    if (p.front() == '/') return false;
    if (p.find('\\') != std::string::npos) return false;
    if (p.find('\0') != std::string::npos) return false;

    std::string_view sv(p);
    while (!sv.empty()) {
        const auto pos = sv.find('/');
        if (sv.substr(0, pos) == "..") return false;
        if (pos == std::string_view::npos) break;
        sv.remove_prefix(pos + 1);
    }
    return true;
}

Result ArchivePathPolicy::NormalizeEntryPath(const char* raw_path, std::string& out_relative) const {
    out_relative = NormalizeArchivePath(raw_path ? std::string(raw_path) : std::string());
    if (out_relative.empty() || out_relative == ".") return Result::Ok();

    if (!IsSafeRelativePath(out_relative)) {
        return Result::Fail(-1, "Unsafe path in archive: " + out_relative);
    }
    return Result::Ok();
}

} // namespace seed
