#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lexis::vfs {

/// ZIP archive that only holds its file descriptor while a read is in
/// progress. The central directory is indexed once at construction; every
/// read() reopens the archive and closes it again before returning, so many
/// archives can be referenced at once without exhausting descriptors.
class OpenOnDemandArchive {
    struct Private { explicit Private() = default; };

public:
    /// Index the archive at `archive_path`. Fails with
    /// ErrorKind::ArchiveConstructFailed if it is missing or not a ZIP.
    static Result<std::shared_ptr<OpenOnDemandArchive>> open(
        const fs::path& archive_path);

    OpenOnDemandArchive(Private, fs::path archive_path);

    // Non-copyable
    OpenOnDemandArchive(const OpenOnDemandArchive&) = delete;
    OpenOnDemandArchive& operator=(const OpenOnDemandArchive&) = delete;

    /// Full uncompressed contents of `entry` (exact, case-sensitive name).
    Result<std::string> read(std::string_view entry) const;

    bool contains(std::string_view entry) const;

    /// True if some listed name starts with `prefix`.
    bool has_prefix(std::string_view prefix) const;

    std::optional<u64> entry_size(std::string_view entry) const;

    /// Entry names in central-directory order.
    const std::vector<std::string>& names() const { return names_; }

    const fs::path& path() const { return archive_path_; }

private:
    struct EntryInfo {
        u64 uncompressed_size = 0;
    };

    fs::path archive_path_;
    std::vector<std::string> names_;
    std::unordered_map<std::string, EntryInfo> entries_;
};

} // namespace lexis::vfs
