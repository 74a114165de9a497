#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace lexis::io {

/// Gzip file writer that batches small writes into one large buffer before
/// handing them to zlib. Meant for serializing big payloads.
class BufferedCompressionWriter {
    struct Private { explicit Private() = default; };

public:
    static constexpr size_t MB = size_t{1} << 20;
    static constexpr size_t DEFAULT_BUFFER_SIZE = 2 * MB;

    /// Create (truncate) `path` for writing at `level` (1 = fastest,
    /// 9 = smallest).
    static Result<std::unique_ptr<BufferedCompressionWriter>> open(
        const fs::path& path, int level = 9,
        size_t buffer_size = DEFAULT_BUFFER_SIZE);

    BufferedCompressionWriter(Private, fs::path path, size_t buffer_size);
    ~BufferedCompressionWriter();

    // Non-copyable
    BufferedCompressionWriter(const BufferedCompressionWriter&) = delete;
    BufferedCompressionWriter& operator=(const BufferedCompressionWriter&) = delete;

    /// Append `data`. If it does not fit in the buffer (limit `size`, or the
    /// configured buffer size when 0), the buffered bytes are compressed
    /// first and `data` starts the next batch.
    Result<void> write(std::string_view data, size_t size = 0);

    /// Compress buffered bytes and sync-flush the zlib stream.
    Result<void> flush();

    /// Write what is left and close the file. Safe to call twice.
    Result<void> close();

    bool is_open() const { return gz_ != nullptr; }
    size_t buffered() const { return buffer_.size(); }
    size_t buffer_size() const { return buffer_size_; }
    const fs::path& path() const { return path_; }

private:
    /// Hand the current buffer to zlib, then start a new batch with `next`.
    Result<void> write_gzip(std::string_view next);

    fs::path path_;
    size_t buffer_size_;
    std::string buffer_;
    void* gz_ = nullptr; // gzFile from zlib
};

} // namespace lexis::io
