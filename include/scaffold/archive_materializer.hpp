#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>

namespace seed {

enum class ExtractionErrorKind {
    AlreadyExists,   // the target name is taken, nothing was written
    InvalidArchive,  // the bytes are not a readable archive, or an entry is corrupt/unsafe
    Filesystem,      // creating or writing a node failed
};

const char* ToString(ExtractionErrorKind kind);

struct ExtractionError {
    ExtractionErrorKind kind = ExtractionErrorKind::Filesystem;
    std::string path;  // node involved, empty when not applicable
    std::string msg;
    int err = 0;       // errno when the failure came from a system call

    std::string Describe() const;
};

struct ExtractStats {
    std::uint64_t files = 0;
    std::uint64_t directories = 0;
    std::uint64_t bytes = 0;
    std::uint64_t skipped = 0;  // entries that are neither files nor directories
};

// Fails when base_dir/name exists, telling a file from a directory apart.
Result CheckTargetAvailable(const std::string& base_dir, const std::string& name);

// Unpacks a generated project archive (zip, or tar optionally gzip-compressed)
// into a new directory. The target must not exist yet; files and directories
// keep their stored permission bits. The payload is fully decoded once before
// the target is created, so an unreadable or unsafe archive writes nothing.
// A filesystem failure later on leaves whatever was already written in place.
class ArchiveMaterializer {
  public:
    struct Options {
        std::string base_dir = ".";
    };

    ArchiveMaterializer() = default;
    explicit ArchiveMaterializer(const Options& opt) : opt_(opt) {}

    std::expected<ExtractStats, ExtractionError> Extract(std::span<const std::uint8_t> archive_bytes,
                                                         const std::string& target_name) const;

  private:
    Options opt_{};
};

} // namespace seed
