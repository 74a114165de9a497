#include "vfs/path_pointer.hpp"

#include "io/file_stream.hpp"
#include "io/gzip_stream.hpp"
#include "io/memory_stream.hpp"
#include "vfs/resource_url.hpp"

#include <spdlog/fmt/fmt.h>

#include <system_error>

namespace lexis::vfs {

const char* path_pointer_kind_name(PathPointerKind kind) {
    switch (kind) {
    case PathPointerKind::File: return "FileSystemPathPointer";
    case PathPointerKind::GzipFile: return "GzipFileSystemPathPointer";
    case PathPointerKind::ZipEntry: return "ZipEntryPathPointer";
    }
    return "PathPointer";
}

Result<std::unique_ptr<io::SeekableUnicodeStreamReader>> PathPointer::open_text(
    std::string_view encoding, io::DecodeErrors errors) const {
    auto stream = open();
    if (!stream) return stream.error();
    return io::SeekableUnicodeStreamReader::create(std::move(stream.value()),
                                                   encoding, errors);
}

std::string PathPointer::describe() const {
    return fmt::format("{}('{}')", path_pointer_kind_name(kind()), to_string());
}

// --- FileSystemPathPointer ---

FileSystemPathPointer::FileSystemPathPointer(Private, fs::path absolute_path)
    : path_(std::move(absolute_path)) {}

namespace {

Result<fs::path> existing_absolute(const fs::path& path) {
    std::error_code ec;
    auto absolute = fs::absolute(path, ec);
    if (ec) {
        return Error(ErrorKind::NotFound,
                     fmt::format("No such file or directory: '{}'", path.string()));
    }
    absolute = absolute.lexically_normal();
    if (!fs::exists(absolute, ec)) {
        return Error(ErrorKind::NotFound,
                     fmt::format("No such file or directory: '{}'",
                                 absolute.string()));
    }
    return absolute;
}

} // namespace

Result<PathPointerPtr> FileSystemPathPointer::create(const fs::path& path) {
    auto absolute = existing_absolute(path);
    if (!absolute) return absolute.error();
    return PathPointerPtr(std::make_unique<FileSystemPathPointer>(
        Private{}, std::move(absolute.value())));
}

Result<io::ByteStreamPtr> FileSystemPathPointer::open() const {
    auto stream = io::FileStream::open(path_);
    if (!stream) return stream.error();
    return io::ByteStreamPtr(std::move(stream.value()));
}

Result<u64> FileSystemPathPointer::file_size() const {
    std::error_code ec;
    auto size = fs::file_size(path_, ec);
    if (ec) {
        return Error(ErrorKind::IoError,
                     fmt::format("Cannot stat '{}': {}", path_.string(),
                                 ec.message()));
    }
    return static_cast<u64>(size);
}

Result<PathPointerPtr> FileSystemPathPointer::join(std::string_view child) const {
    return FileSystemPathPointer::create(path_ / fs::path(child));
}

// --- GzipFileSystemPathPointer ---

Result<PathPointerPtr> GzipFileSystemPathPointer::create(const fs::path& path) {
    auto absolute = existing_absolute(path);
    if (!absolute) return absolute.error();
    return PathPointerPtr(std::make_unique<GzipFileSystemPathPointer>(
        Private{}, std::move(absolute.value())));
}

Result<io::ByteStreamPtr> GzipFileSystemPathPointer::open() const {
    auto stream = io::GzipFileStream::open(path_);
    if (!stream) return stream.error();
    return io::ByteStreamPtr(std::move(stream.value()));
}

// --- ZipEntryPathPointer ---

ZipEntryPathPointer::ZipEntryPathPointer(
    Private, std::shared_ptr<const OpenOnDemandArchive> archive, std::string entry)
    : archive_(std::move(archive)), entry_(std::move(entry)) {}

std::string ZipEntryPathPointer::normalize_entry(std::string_view entry) {
    if (entry.empty()) return {};
    auto normalized = normalize_resource_name(entry, true);
    normalized.erase(0, normalized.find_first_not_of('/'));
    return normalized;
}

Result<PathPointerPtr> ZipEntryPathPointer::create(
    std::shared_ptr<const OpenOnDemandArchive> archive, std::string_view entry) {
    auto normalized = normalize_entry(entry);

    if (!normalized.empty() && !archive->contains(normalized)) {
        // Directories need not be listed explicitly.
        std::string prefix = normalized;
        if (prefix.back() != '/') prefix += '/';
        if (!archive->has_prefix(prefix)) {
            return Error(ErrorKind::ArchiveEntryNotFound,
                         fmt::format("Zipfile '{}' does not contain '{}'",
                                     archive->path().string(), normalized));
        }
    }

    return PathPointerPtr(std::make_unique<ZipEntryPathPointer>(
        Private{}, std::move(archive), std::move(normalized)));
}

Result<PathPointerPtr> ZipEntryPathPointer::create(const fs::path& archive_path,
                                                   std::string_view entry) {
    auto archive = OpenOnDemandArchive::open(archive_path);
    if (!archive) return archive.error();
    return create(std::shared_ptr<const OpenOnDemandArchive>(archive.value()),
                  entry);
}

Result<io::ByteStreamPtr> ZipEntryPathPointer::open() const {
    auto data = archive_->read(entry_);
    if (!data) return data.error();

    if (ends_with(entry_, ".gz")) {
        auto inflated = io::gunzip(data.value(), to_string());
        if (!inflated) return inflated.error();
        return io::ByteStreamPtr(std::make_unique<io::MemoryStream>(
            std::move(inflated.value()), to_string()));
    }
    return io::ByteStreamPtr(
        std::make_unique<io::MemoryStream>(std::move(data.value()), to_string()));
}

Result<u64> ZipEntryPathPointer::file_size() const {
    auto size = archive_->entry_size(entry_);
    if (!size) {
        return Error(ErrorKind::NotFound,
                     fmt::format("'{}' is not a listed entry of {}", entry_,
                                 archive_->path().string()));
    }
    return *size;
}

Result<PathPointerPtr> ZipEntryPathPointer::join(std::string_view child) const {
    std::string joined = entry_.empty() ? std::string(child)
                                        : entry_ + "/" + std::string(child);
    return PathPointerPtr(std::make_unique<ZipEntryPathPointer>(
        Private{}, archive_, normalize_entry(joined)));
}

std::string ZipEntryPathPointer::to_string() const {
    if (entry_.empty()) return archive_->path().string();
    return posix_normpath(archive_->path().generic_string() + "/" + entry_);
}

} // namespace lexis::vfs
