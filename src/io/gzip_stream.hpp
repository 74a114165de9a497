#pragma once

#include "io/byte_stream.hpp"

#include <string_view>

namespace lexis::io {

/// Decompressing byte stream over a gzip file on disk. Positions are in
/// uncompressed bytes. Backward seeks rewind and re-inflate (zlib emulates
/// them), so they are slow on large files.
class GzipFileStream : public ByteStream {
    struct Private { explicit Private() = default; };

public:
    static Result<std::unique_ptr<GzipFileStream>> open(const fs::path& path);
    ~GzipFileStream() override;

    // Non-copyable
    GzipFileStream(const GzipFileStream&) = delete;
    GzipFileStream& operator=(const GzipFileStream&) = delete;

    Result<std::string> read(
        std::optional<size_t> size = std::nullopt) override;
    Result<u64> seek(i64 offset,
                     SeekOrigin origin = SeekOrigin::Begin) override;
    u64 tell() const override;
    void close() override;
    bool closed() const override { return gz_ == nullptr; }
    std::string name() const override { return path_.string(); }

    GzipFileStream(Private, fs::path path);

private:
    /// Uncompressed size, found by inflating to the end once.
    Result<u64> uncompressed_size();

    fs::path path_;
    void* gz_ = nullptr; // gzFile from zlib
    std::optional<u64> size_;
};

/// Inflate a complete gzip buffer (all members) in memory.
Result<std::string> gunzip(std::string_view compressed,
                           std::string_view name = "<memory>");

} // namespace lexis::io
