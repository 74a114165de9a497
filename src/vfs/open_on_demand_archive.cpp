#include "vfs/open_on_demand_archive.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <minizip/unzip.h>

#include <algorithm>
#include <limits>

namespace lexis::vfs {

namespace {

/// Owns an unzFile for the duration of one operation.
class ArchiveHandle {
public:
    explicit ArchiveHandle(const fs::path& path)
        : handle_(unzOpen64(path.string().c_str())) {}
    ~ArchiveHandle() {
        if (handle_) unzClose(handle_);
    }

    ArchiveHandle(const ArchiveHandle&) = delete;
    ArchiveHandle& operator=(const ArchiveHandle&) = delete;

    unzFile get() const { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    unzFile handle_;
};

/// Keeps the current entry open until close() or destruction.
class CurrentEntry {
public:
    explicit CurrentEntry(unzFile handle)
        : handle_(handle), open_(unzOpenCurrentFile(handle) == UNZ_OK) {}
    ~CurrentEntry() {
        if (open_) unzCloseCurrentFile(handle_);
    }

    CurrentEntry(const CurrentEntry&) = delete;
    CurrentEntry& operator=(const CurrentEntry&) = delete;

    bool is_open() const { return open_; }

    /// Returns UNZ_CRCERROR when the data did not match its checksum.
    int close() {
        open_ = false;
        return unzCloseCurrentFile(handle_);
    }

private:
    unzFile handle_;
    bool open_;
};

} // namespace

OpenOnDemandArchive::OpenOnDemandArchive(Private, fs::path archive_path)
    : archive_path_(std::move(archive_path)) {}

Result<std::shared_ptr<OpenOnDemandArchive>> OpenOnDemandArchive::open(
    const fs::path& archive_path) {
    ArchiveHandle zip(archive_path);
    if (!zip) {
        return Error(ErrorKind::ArchiveConstructFailed,
                     fmt::format("Failed to open ZIP archive: {}",
                                 archive_path.string()));
    }

    auto archive = std::make_shared<OpenOnDemandArchive>(Private{}, archive_path);

    // Read central directory
    int ret = unzGoToFirstFile(zip.get());
    while (ret == UNZ_OK) {
        unz_file_info64 file_info;
        if (unzGetCurrentFileInfo64(zip.get(), &file_info, nullptr, 0,
                                    nullptr, 0, nullptr, 0) != UNZ_OK) {
            return Error(ErrorKind::ArchiveConstructFailed,
                         fmt::format("Corrupt central directory in {}",
                                     archive_path.string()));
        }

        std::string name(file_info.size_filename, '\0');
        unzGetCurrentFileInfo64(zip.get(), &file_info, name.data(),
                                static_cast<uLong>(name.size()), nullptr, 0,
                                nullptr, 0);

        archive->entries_[name].uncompressed_size = file_info.uncompressed_size;
        archive->names_.push_back(std::move(name));

        ret = unzGoToNextFile(zip.get());
    }
    if (ret != UNZ_END_OF_LIST_OF_FILE) {
        return Error(ErrorKind::ArchiveConstructFailed,
                     fmt::format("Failed to list ZIP archive {} (code {})",
                                 archive_path.string(), ret));
    }

    spdlog::debug("ZIP archive {}: {} entries indexed",
                  archive_path.filename().string(), archive->names_.size());
    return archive;
}

Result<std::string> OpenOnDemandArchive::read(std::string_view entry) const {
    auto it = entries_.find(std::string(entry));
    if (it == entries_.end()) {
        return Error(ErrorKind::ArchiveEntryNotFound,
                     fmt::format("There is no item named '{}' in the archive {}",
                                 entry, archive_path_.string()));
    }

    ArchiveHandle zip(archive_path_);
    if (!zip) {
        return Error(ErrorKind::IoError,
                     fmt::format("Failed to reopen ZIP archive: {}",
                                 archive_path_.string()));
    }

    // Case-sensitive lookup
    if (unzLocateFile(zip.get(), it->first.c_str(), 1) != UNZ_OK) {
        return Error(ErrorKind::ArchiveEntryNotFound,
                     fmt::format("Entry '{}' disappeared from {}", entry,
                                 archive_path_.string()));
    }

    CurrentEntry current(zip.get());
    if (!current.is_open()) {
        return Error(ErrorKind::IoError,
                     fmt::format("Cannot open entry '{}' in {}", entry,
                                 archive_path_.string()));
    }

    std::string buffer(it->second.uncompressed_size, '\0');
    u64 total = 0;
    while (total < buffer.size()) {
        auto chunk = static_cast<unsigned>(std::min<u64>(
            buffer.size() - total, std::numeric_limits<int>::max()));
        int n = unzReadCurrentFile(zip.get(), buffer.data() + total, chunk);
        if (n < 0) {
            return Error(ErrorKind::IoError,
                         fmt::format("Error {} reading '{}' from {}", n, entry,
                                     archive_path_.string()));
        }
        if (n == 0) break;
        total += static_cast<u64>(n);
    }
    if (total != buffer.size()) {
        return Error(ErrorKind::IoError,
                     fmt::format("Short read of '{}' from {}: {} of {} bytes",
                                 entry, archive_path_.string(), total,
                                 buffer.size()));
    }

    if (current.close() == UNZ_CRCERROR) {
        return Error(ErrorKind::IoError,
                     fmt::format("CRC mismatch for '{}' in {}", entry,
                                 archive_path_.string()));
    }

    return buffer;
}

bool OpenOnDemandArchive::contains(std::string_view entry) const {
    return entries_.contains(std::string(entry));
}

bool OpenOnDemandArchive::has_prefix(std::string_view prefix) const {
    return std::any_of(names_.begin(), names_.end(), [&](const std::string& n) {
        return n.compare(0, prefix.size(), prefix) == 0;
    });
}

std::optional<u64> OpenOnDemandArchive::entry_size(std::string_view entry) const {
    auto it = entries_.find(std::string(entry));
    if (it == entries_.end()) return std::nullopt;
    return it->second.uncompressed_size;
}

} // namespace lexis::vfs
