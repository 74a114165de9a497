#include "io/buffered_gzip_writer.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <zlib.h>

namespace lexis::io {

BufferedCompressionWriter::BufferedCompressionWriter(Private, fs::path path,
                                                     size_t buffer_size)
    : path_(std::move(path)), buffer_size_(buffer_size) {}

Result<std::unique_ptr<BufferedCompressionWriter>>
BufferedCompressionWriter::open(const fs::path& path, int level,
                                size_t buffer_size) {
    if (level < 1 || level > 9) {
        return Error(ErrorKind::InvalidArgument,
                     "compression level must be 1..9, got " +
                         std::to_string(level));
    }

    auto writer =
        std::make_unique<BufferedCompressionWriter>(Private{}, path, buffer_size);
    std::string mode = "wb" + std::to_string(level);
    writer->gz_ = gzopen(path.string().c_str(), mode.c_str());
    if (!writer->gz_) {
        return Error(ErrorKind::IoError,
                     "Failed to create gzip file: " + path.string());
    }
    writer->buffer_.reserve(std::min(buffer_size, DEFAULT_BUFFER_SIZE));
    return std::move(writer);
}

BufferedCompressionWriter::~BufferedCompressionWriter() {
    auto result = close();
    if (!result) {
        spdlog::error("Closing {} failed: {}", path_.string(),
                      result.error().message);
    }
}

Result<void> BufferedCompressionWriter::write_gzip(std::string_view next) {
    if (!buffer_.empty()) {
        int n = gzwrite(static_cast<gzFile>(gz_), buffer_.data(),
                        static_cast<unsigned>(buffer_.size()));
        if (n <= 0) {
            int errnum = 0;
            const char* msg = gzerror(static_cast<gzFile>(gz_), &errnum);
            return Error(ErrorKind::IoError,
                         path_.string() + ": " + (msg ? msg : "gzwrite failed"));
        }
    }
    buffer_.assign(next.data(), next.size());
    return {};
}

Result<void> BufferedCompressionWriter::write(std::string_view data,
                                              size_t size) {
    if (!gz_) {
        return Error(ErrorKind::IoError, "write to closed file " + path_.string());
    }
    if (size == 0) size = buffer_size_;

    if (buffer_.size() + data.size() <= size) {
        buffer_.append(data.data(), data.size());
        return {};
    }
    return write_gzip(data);
}

Result<void> BufferedCompressionWriter::flush() {
    if (!gz_) return {};
    auto written = write_gzip({});
    if (!written) return written;
    if (gzflush(static_cast<gzFile>(gz_), Z_SYNC_FLUSH) != Z_OK) {
        return Error(ErrorKind::IoError, "gzflush failed on " + path_.string());
    }
    return {};
}

Result<void> BufferedCompressionWriter::close() {
    if (!gz_) return {};

    auto written = write_gzip({});
    int rc = gzclose_w(static_cast<gzFile>(gz_));
    gz_ = nullptr;
    if (!written) return written;
    if (rc != Z_OK) {
        return Error(ErrorKind::IoError, "gzclose failed on " + path_.string());
    }
    spdlog::debug("wrote {}", path_.string());
    return {};
}

} // namespace lexis::io
