#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "io/byte_stream.hpp"
#include "io/unicode_reader.hpp"
#include "vfs/open_on_demand_archive.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace lexis::vfs {

enum class PathPointerKind {
    File,     ///< plain file or directory on disk
    GzipFile, ///< gzip file on disk, decompressed on open
    ZipEntry, ///< entry (or implicit directory) inside a ZIP archive
};

const char* path_pointer_kind_name(PathPointerKind kind);

class PathPointer;
using PathPointerPtr = std::unique_ptr<PathPointer>;

/// A located resource that can be opened, measured and extended.
/// Pointers are immutable once created.
class PathPointer {
public:
    virtual ~PathPointer() = default;

    /// Open for reading. Each call returns an independent stream.
    virtual Result<io::ByteStreamPtr> open() const = 0;

    /// Open and wrap in a decoding reader.
    Result<std::unique_ptr<io::SeekableUnicodeStreamReader>> open_text(
        std::string_view encoding,
        io::DecodeErrors errors = io::DecodeErrors::Strict) const;

    /// Size in bytes as stored (compressed size for gzip files).
    virtual Result<u64> file_size() const = 0;

    /// Pointer to `child` (a '/'-separated relative path) under this one.
    virtual Result<PathPointerPtr> join(std::string_view child) const = 0;

    virtual PathPointerKind kind() const = 0;

    /// Location as a path string.
    virtual std::string to_string() const = 0;

    /// Debug form: kind plus location.
    std::string describe() const;
};

/// A path on the local filesystem. The path must exist at construction.
class FileSystemPathPointer : public PathPointer {
protected:
    struct Private { explicit Private() = default; };

public:
    /// Fails with ErrorKind::NotFound when `path` does not exist.
    static Result<PathPointerPtr> create(const fs::path& path);

    Result<io::ByteStreamPtr> open() const override;
    Result<u64> file_size() const override;

    /// The joined path must exist; the result is always a plain file
    /// pointer.
    Result<PathPointerPtr> join(std::string_view child) const override;

    PathPointerKind kind() const override { return PathPointerKind::File; }
    std::string to_string() const override { return path_.string(); }

    const fs::path& path() const { return path_; }

    FileSystemPathPointer(Private, fs::path absolute_path);

protected:
    fs::path path_;
};

/// A gzip file on disk; open() yields decompressed bytes.
class GzipFileSystemPathPointer : public FileSystemPathPointer {
public:
    static Result<PathPointerPtr> create(const fs::path& path);

    Result<io::ByteStreamPtr> open() const override;
    PathPointerKind kind() const override { return PathPointerKind::GzipFile; }

    GzipFileSystemPathPointer(Private, fs::path absolute_path)
        : FileSystemPathPointer(Private{}, std::move(absolute_path)) {}
};

/// An entry inside a ZIP archive. An empty entry names the archive root.
class ZipEntryPathPointer : public PathPointer {
    struct Private { explicit Private() = default; };

public:
    /// Validate and create. The entry must be listed in the archive, or be
    /// an implicit directory: some listed name starts with entry + "/".
    static Result<PathPointerPtr> create(
        std::shared_ptr<const OpenOnDemandArchive> archive,
        std::string_view entry = "");

    /// Index the archive at `archive_path` first.
    static Result<PathPointerPtr> create(const fs::path& archive_path,
                                         std::string_view entry = "");

    /// Fully reads the entry; ".gz" entries are decompressed.
    Result<io::ByteStreamPtr> open() const override;
    Result<u64> file_size() const override;

    /// Joined entries are not checked against the archive.
    Result<PathPointerPtr> join(std::string_view child) const override;

    PathPointerKind kind() const override { return PathPointerKind::ZipEntry; }
    std::string to_string() const override;

    const std::shared_ptr<const OpenOnDemandArchive>& archive() const {
        return archive_;
    }
    const std::string& entry() const { return entry_; }

    ZipEntryPathPointer(Private,
                        std::shared_ptr<const OpenOnDemandArchive> archive,
                        std::string entry);

private:
    /// Normalize an entry name, dropping any leading '/'.
    static std::string normalize_entry(std::string_view entry);

    std::shared_ptr<const OpenOnDemandArchive> archive_;
    std::string entry_;
};

} // namespace lexis::vfs
