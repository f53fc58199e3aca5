#include "scaffold/archive_materializer.hpp"

#include "io/file_writer.hpp"
#include "scaffold/archive_path_policy.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <memory>
#include <sys/stat.h>
#include <vector>

namespace seed {

namespace fs = std::filesystem;

namespace {

constexpr mode_t kDefaultDirMode = 0755;
constexpr mode_t kDefaultFileMode = 0644;

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

std::string ArchiveErr(archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

std::unexpected<ExtractionError> Fail(ExtractionErrorKind kind,
                                      std::string path,
                                      std::string msg,
                                      int err = 0) {
    return std::unexpected(ExtractionError{
        .kind = kind, .path = std::move(path), .msg = std::move(msg), .err = err});
}

std::unexpected<ExtractionError> FailErrno(const std::string& path, const char* what) {
    const int e = errno;
    return Fail(ExtractionErrorKind::Filesystem, path,
                std::string(what) + " (" + std::strerror(e) + ")", e);
}

bool IsValidTargetName(const std::string& name) {
    return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos;
}

// Creates root/rel and whatever is missing in between. Intermediate
// directories get kDefaultDirMode; an existing non-directory is an error.
std::expected<void, ExtractionError> MakeDirectoryChain(const fs::path& root,
                                                        const fs::path& rel,
                                                        ExtractStats& stats) {
    fs::path cur = root;
    for (const auto& part : rel) {
        cur /= part;
        if (::mkdir(cur.c_str(), kDefaultDirMode) == 0) {
            ++stats.directories;
            continue;
        }
        if (errno != EEXIST) {
            return FailErrno(cur.string(), "Failed to create directory");
        }
        struct stat st{};
        if (::stat(cur.c_str(), &st) != 0) {
            return FailErrno(cur.string(), "Failed to stat");
        }
        if (!S_ISDIR(st.st_mode)) {
            return Fail(ExtractionErrorKind::Filesystem, cur.string(),
                        "Path exists and is not a directory", ENOTDIR);
        }
    }
    return {};
}

mode_t EntryPerm(archive_entry* entry, mode_t fallback) {
    const mode_t perm = archive_entry_perm(entry) & 0777;
    return perm != 0 ? perm : fallback;
}

using ArchivePtr = std::unique_ptr<archive, ArchiveReadDeleter>;

// Zip goes through the seekable reader so the central directory is read up
// front: a zip cut short anywhere fails here instead of mid-extraction.
std::expected<ArchivePtr, ExtractionError> OpenArchive(std::span<const std::uint8_t> bytes) {
    ArchivePtr ar(archive_read_new());
    if (!ar) {
        return Fail(ExtractionErrorKind::InvalidArchive, {}, "archive_read_new failed");
    }
    archive_read_support_filter_gzip(ar.get());
    archive_read_support_format_zip_seekable(ar.get());
    archive_read_support_format_tar(ar.get());

    if (archive_read_open_memory(ar.get(), bytes.data(), bytes.size()) != ARCHIVE_OK) {
        return Fail(ExtractionErrorKind::InvalidArchive, {},
                    "Cannot open archive: " + ArchiveErr(ar.get()));
    }
    return ar;
}

// Walks every header and decodes every entry without touching the disk.
// Truncated streams, bad checksums and unsafe entry names all surface here.
std::expected<void, ExtractionError> ScanArchive(std::span<const std::uint8_t> bytes,
                                                 const ArchivePathPolicy& path_policy,
                                                 std::vector<std::uint8_t>& buf) {
    auto ar = OpenArchive(bytes);
    if (!ar) return std::unexpected(std::move(ar.error()));

    archive_entry* entry = nullptr;
    int r;
    while ((r = archive_read_next_header(ar->get(), &entry)) != ARCHIVE_EOF) {
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return Fail(ExtractionErrorKind::InvalidArchive, {},
                        "Cannot read archive: " + ArchiveErr(ar->get()));
        }

        const char* raw_name = archive_entry_pathname(entry);
        std::string rel;
        if (auto res = path_policy.NormalizeEntryPath(raw_name, rel); !res.ok) {
            return Fail(ExtractionErrorKind::InvalidArchive, raw_name ? raw_name : "", res.msg);
        }

        la_ssize_t n;
        do {
            n = archive_read_data(ar->get(), buf.data(), buf.size());
        } while (n > 0);
        if (n < 0) {
            return Fail(ExtractionErrorKind::InvalidArchive, rel,
                        "Cannot read entry " + rel + ": " + ArchiveErr(ar->get()));
        }
    }
    return {};
}

} // namespace

const char* ToString(ExtractionErrorKind kind) {
    switch (kind) {
        case ExtractionErrorKind::AlreadyExists:  return "already exists";
        case ExtractionErrorKind::InvalidArchive: return "invalid archive";
        case ExtractionErrorKind::Filesystem:     return "filesystem error";
    }
    return "unknown";
}

std::string ExtractionError::Describe() const {
    std::string out = ToString(kind);
    out += ": ";
    out += msg;
    if (!path.empty() && msg.find(path) == std::string::npos) {
        out += ": " + path;
    }
    return out;
}

Result CheckTargetAvailable(const std::string& base_dir, const std::string& name) {
    const fs::path target = fs::path(base_dir) / name;

    struct stat st{};
    if (::lstat(target.c_str(), &st) != 0) {
        if (errno == ENOENT) return Result::Ok();
        return Result::Fail(errno, "cannot check '" + name + "' (" + std::strerror(errno) + ")");
    }
    const char* what = S_ISDIR(st.st_mode) ? "directory" : "file";
    return Result::Fail(EEXIST, std::string("a ") + what + " named '" + name + "' already exists");
}

std::expected<ExtractStats, ExtractionError>
ArchiveMaterializer::Extract(std::span<const std::uint8_t> archive_bytes,
                             const std::string& target_name) const {
    if (!IsValidTargetName(target_name)) {
        return Fail(ExtractionErrorKind::Filesystem, target_name,
                    "Invalid target directory name '" + target_name + "'", EINVAL);
    }

    const fs::path root = fs::path(opt_.base_dir) / target_name;

    if (auto r = CheckTargetAvailable(opt_.base_dir, target_name); !r.ok) {
        const auto kind = r.err == EEXIST ? ExtractionErrorKind::AlreadyExists
                                          : ExtractionErrorKind::Filesystem;
        return Fail(kind, root.string(), r.msg, r.err);
    }

    if (archive_bytes.empty()) {
        return Fail(ExtractionErrorKind::InvalidArchive, {}, "Empty archive payload");
    }

    const ArchivePathPolicy path_policy{};
    std::vector<std::uint8_t> buf(64 * 1024);

    // The whole payload is checked before anything touches the disk, so a
    // corrupt or truncated archive leaves no directory behind.
    if (auto scanned = ScanArchive(archive_bytes, path_policy, buf); !scanned) {
        return std::unexpected(std::move(scanned.error()));
    }

    auto ar = OpenArchive(archive_bytes);
    if (!ar) return std::unexpected(std::move(ar.error()));

    if (::mkdir(root.c_str(), 0777) != 0) {
        if (errno == EEXIST) {
            return Fail(ExtractionErrorKind::AlreadyExists, root.string(),
                        "'" + target_name + "' already exists", EEXIST);
        }
        return FailErrno(root.string(), "Failed to create target directory");
    }

    ExtractStats stats;
    archive_entry* entry = nullptr;
    int r;
    while ((r = archive_read_next_header(ar->get(), &entry)) != ARCHIVE_EOF) {
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return Fail(ExtractionErrorKind::InvalidArchive, {},
                        "archive_read_next_header: " + ArchiveErr(ar->get()));
        }

        const char* raw_name = archive_entry_pathname(entry);
        std::string rel;
        if (auto res = path_policy.NormalizeEntryPath(raw_name, rel); !res.ok) {
            return Fail(ExtractionErrorKind::InvalidArchive, raw_name ? raw_name : "", res.msg);
        }
        if (rel.empty() || rel == ".") {
            (void)archive_read_data_skip(ar->get());
            continue;
        }

        const fs::path rel_path(rel);
        const fs::path target = root / rel_path;

        // tar hardlinks report AE_IFREG with no data
        const auto type = archive_entry_hardlink(entry) ? AE_IFLNK : archive_entry_filetype(entry);

        switch (type) {
            case AE_IFDIR: {
                if (auto made = MakeDirectoryChain(root, rel_path, stats); !made) {
                    return std::unexpected(std::move(made.error()));
                }
                if (::chmod(target.c_str(), EntryPerm(entry, kDefaultDirMode)) != 0) {
                    return FailErrno(target.string(), "Failed to set directory mode");
                }
                break;
            }

            case AE_IFREG: {
                if (rel_path.has_parent_path()) {
                    if (auto made = MakeDirectoryChain(root, rel_path.parent_path(), stats); !made) {
                        return std::unexpected(std::move(made.error()));
                    }
                }

                FileWriter out;
                if (auto w = FileWriter::Open(target.string(), EntryPerm(entry, kDefaultFileMode), out);
                    !w.ok) {
                    return Fail(ExtractionErrorKind::Filesystem, target.string(), w.msg, w.err);
                }

                while (true) {
                    const la_ssize_t n = archive_read_data(ar->get(), buf.data(), buf.size());
                    if (n == 0) break;
                    if (n < 0) {
                        return Fail(ExtractionErrorKind::InvalidArchive, rel,
                                    "Cannot read entry " + rel + ": " + ArchiveErr(ar->get()));
                    }
                    auto w = out.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
                    if (!w.ok) {
                        return Fail(ExtractionErrorKind::Filesystem, target.string(), w.msg, w.err);
                    }
                    stats.bytes += static_cast<std::uint64_t>(n);
                }

                if (auto c = out.Close(); !c.ok) {
                    return Fail(ExtractionErrorKind::Filesystem, target.string(), c.msg, c.err);
                }
                ++stats.files;
                break;
            }

            default:
                // symlinks, hardlinks and device nodes are not part of a generated project
                (void)archive_read_data_skip(ar->get());
                ++stats.skipped;
                break;
        }
    }

    return stats;
}

} // namespace seed
