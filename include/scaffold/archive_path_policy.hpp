#pragma once

#include "util/result.hpp"

#include <string>

namespace seed {

// Maps archive entry names to paths relative to the extraction root and
// refuses names that would land outside it.
class ArchivePathPolicy {
  public:
    // Empty out_relative (or ".") means the entry names the root itself.
    Result NormalizeEntryPath(const char* raw_path, std::string& out_relative) const;

    static bool IsSafeRelativePath(const std::string& p);
};

} // namespace seed
