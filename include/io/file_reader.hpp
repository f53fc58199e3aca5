#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace seed {

class FileOrStdinReader final : public IReader {
public:
    // "-" reads from stdin.
    static Result Open(std::string path, FileOrStdinReader &out);

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

// Drains the reader into out.
Result ReadAll(IReader& reader, std::vector<std::uint8_t>& out);

// Opens path (or stdin for "-") and reads it fully.
Result ReadFileOrStdin(const std::string& path, std::vector<std::uint8_t>& out);
Result ReadFileOrStdin(const std::string& path, std::string& out);

} // namespace seed
