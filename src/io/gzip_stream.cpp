#include "io/gzip_stream.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <limits>
#include <spdlog/spdlog.h>
#include <zlib.h>

namespace lexis::io {

namespace {

gzFile as_gz(void* handle) {
    return static_cast<gzFile>(handle);
}

std::string gz_error_message(gzFile file) {
    int errnum = 0;
    const char* msg = gzerror(file, &errnum);
    return msg ? msg : "unknown zlib error";
}

} // namespace

GzipFileStream::GzipFileStream(Private, fs::path path) : path_(std::move(path)) {}

GzipFileStream::~GzipFileStream() {
    close();
}

Result<std::unique_ptr<GzipFileStream>> GzipFileStream::open(
    const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Error(ErrorKind::NotFound, "No such file: " + path.string());
    }

    auto stream = std::make_unique<GzipFileStream>(Private{}, path);
    stream->gz_ = gzopen(path.string().c_str(), "rb");
    if (!stream->gz_) {
        return Error(ErrorKind::IoError,
                     "Failed to open gzip file: " + path.string());
    }
    gzbuffer(as_gz(stream->gz_), 128 * 1024);
    return std::move(stream);
}

Result<std::string> GzipFileStream::read(std::optional<size_t> size) {
    if (!gz_) {
        return Error(ErrorKind::IoError, "read from closed gzip file " + path_.string());
    }

    std::string out;
    std::array<char, 64 * 1024> chunk;
    size_t remaining = size.value_or(std::numeric_limits<size_t>::max());
    while (remaining > 0) {
        auto want = static_cast<unsigned>(std::min(remaining, chunk.size()));
        int n = gzread(as_gz(gz_), chunk.data(), want);
        if (n < 0) {
            return Error(ErrorKind::IoError, path_.string() + ": " +
                                                 gz_error_message(as_gz(gz_)));
        }
        if (n == 0) break;
        out.append(chunk.data(), static_cast<size_t>(n));
        remaining -= static_cast<size_t>(n);
    }
    return out;
}

Result<u64> GzipFileStream::uncompressed_size() {
    if (size_) return *size_;

    z_off_t saved = gztell(as_gz(gz_));
    std::array<char, 64 * 1024> chunk;
    int n = 0;
    while ((n = gzread(as_gz(gz_), chunk.data(), chunk.size())) > 0) {
    }
    if (n < 0) {
        return Error(ErrorKind::IoError, path_.string() + ": " +
                                             gz_error_message(as_gz(gz_)));
    }
    size_ = static_cast<u64>(gztell(as_gz(gz_)));
    if (gzseek(as_gz(gz_), saved, SEEK_SET) < 0) {
        return Error(ErrorKind::IoError, "gzseek failed on " + path_.string());
    }
    return *size_;
}

Result<u64> GzipFileStream::seek(i64 offset, SeekOrigin origin) {
    if (!gz_) {
        return Error(ErrorKind::IoError, "seek on closed gzip file " + path_.string());
    }

    u64 end = 0;
    if (origin == SeekOrigin::End) {
        auto size = uncompressed_size();
        if (!size) return size.error();
        end = size.value();
    }

    auto target = resolve_seek_target(offset, origin, tell(), end);
    if (!target) return target.error();

    if (gzseek(as_gz(gz_), static_cast<z_off_t>(target.value()), SEEK_SET) < 0) {
        return Error(ErrorKind::IoError, path_.string() + ": " +
                                             gz_error_message(as_gz(gz_)));
    }
    return target.value();
}

u64 GzipFileStream::tell() const {
    if (!gz_) return 0;
    z_off_t pos = gztell(as_gz(gz_));
    return pos < 0 ? 0 : static_cast<u64>(pos);
}

void GzipFileStream::close() {
    if (gz_) {
        gzclose_r(as_gz(gz_));
        gz_ = nullptr;
    }
}

Result<std::string> gunzip(std::string_view compressed, std::string_view name) {
    z_stream zs{};
    // 16 + MAX_WBITS: expect a gzip header rather than a raw zlib stream.
    if (inflateInit2(&zs, 16 + MAX_WBITS) != Z_OK) {
        return Error(ErrorKind::IoError, "inflateInit2 failed");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
    zs.avail_in = static_cast<uInt>(compressed.size());

    std::string out;
    std::array<char, 64 * 1024> chunk;
    int ret = Z_OK;
    while (true) {
        zs.next_out = reinterpret_cast<Bytef*>(chunk.data());
        zs.avail_out = static_cast<uInt>(chunk.size());
        ret = inflate(&zs, Z_NO_FLUSH);
        out.append(chunk.data(), chunk.size() - zs.avail_out);

        if (ret == Z_STREAM_END) {
            // Concatenated gzip members decode as one stream.
            if (zs.avail_in > 0) {
                inflateReset(&zs);
                continue;
            }
            break;
        }
        if (ret != Z_OK) break;
        if (zs.avail_in == 0 && zs.avail_out != 0) {
            ret = Z_BUF_ERROR;
            break;
        }
    }
    std::string detail = zs.msg ? std::string(" (") + zs.msg + ")" : "";
    inflateEnd(&zs);

    if (ret != Z_STREAM_END) {
        return Error(ErrorKind::IoError,
                     std::string(name) + ": corrupt or truncated gzip data" +
                         detail);
    }
    spdlog::trace("inflated {}: {} -> {} bytes", name, compressed.size(),
                  out.size());
    return out;
}

} // namespace lexis::io
