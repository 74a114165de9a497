#include "io/file_stream.hpp"

#include <algorithm>
#include <array>
#include <spdlog/spdlog.h>

namespace lexis::io {

FileStream::FileStream(Private, fs::path path, u64 size)
    : path_(std::move(path)), size_(size) {}

Result<std::unique_ptr<FileStream>> FileStream::open(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        return Error(ErrorKind::NotFound,
                     "No such file: " + path.string() + " (" + ec.message() + ")");
    }

    auto stream = std::make_unique<FileStream>(Private{}, path, size);
    stream->file_.open(path, std::ios::binary);
    if (!stream->file_.is_open()) {
        return Error(ErrorKind::IoError, "Failed to open " + path.string());
    }
    return std::move(stream);
}

Result<std::string> FileStream::read(std::optional<size_t> size) {
    if (!file_.is_open()) {
        return Error(ErrorKind::IoError, "read from closed file " + path_.string());
    }

    std::string out;
    if (size) {
        size_t n = static_cast<size_t>(
            std::min<u64>(*size, size_ > pos_ ? size_ - pos_ : 0));
        out.resize(n);
        file_.read(out.data(), static_cast<std::streamsize>(n));
        out.resize(static_cast<size_t>(file_.gcount()));
    } else {
        std::array<char, 64 * 1024> chunk;
        while (file_.read(chunk.data(), chunk.size()) || file_.gcount() > 0) {
            out.append(chunk.data(), static_cast<size_t>(file_.gcount()));
        }
    }

    if (file_.bad()) {
        return Error(ErrorKind::IoError, "read error on " + path_.string());
    }
    // Hitting EOF is not an error; keep the stream usable for later seeks.
    file_.clear();
    pos_ += out.size();
    return out;
}

Result<u64> FileStream::seek(i64 offset, SeekOrigin origin) {
    if (!file_.is_open()) {
        return Error(ErrorKind::IoError, "seek on closed file " + path_.string());
    }
    auto target = resolve_seek_target(offset, origin, pos_, size_);
    if (!target) return target.error();

    file_.clear();
    file_.seekg(static_cast<std::streamoff>(target.value()), std::ios::beg);
    if (!file_) {
        return Error(ErrorKind::IoError, "seek failed on " + path_.string());
    }
    pos_ = target.value();
    return pos_;
}

void FileStream::close() {
    if (file_.is_open()) {
        file_.close();
        spdlog::trace("closed {}", path_.string());
    }
}

} // namespace lexis::io
