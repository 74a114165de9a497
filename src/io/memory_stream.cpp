#include "io/memory_stream.hpp"

#include <algorithm>

namespace lexis::io {

Result<u64> resolve_seek_target(i64 offset, SeekOrigin origin, u64 current,
                                u64 size) {
    i64 base = 0;
    switch (origin) {
    case SeekOrigin::Begin: base = 0; break;
    case SeekOrigin::Current: base = static_cast<i64>(current); break;
    case SeekOrigin::End: base = static_cast<i64>(size); break;
    }
    i64 target = base + offset;
    if (target < 0) {
        return Error(ErrorKind::InvalidArgument,
                     "negative seek position " + std::to_string(target));
    }
    return static_cast<u64>(target);
}

MemoryStream::MemoryStream(std::string data, std::string name)
    : data_(std::move(data)), name_(std::move(name)) {}

Result<std::string> MemoryStream::read(std::optional<size_t> size) {
    if (closed_) {
        return Error(ErrorKind::IoError, "read from closed stream " + name_);
    }
    if (pos_ >= data_.size()) return std::string();

    size_t available = data_.size() - static_cast<size_t>(pos_);
    size_t n = size ? std::min(*size, available) : available;
    std::string out = data_.substr(static_cast<size_t>(pos_), n);
    pos_ += n;
    return out;
}

Result<u64> MemoryStream::seek(i64 offset, SeekOrigin origin) {
    if (closed_) {
        return Error(ErrorKind::IoError, "seek on closed stream " + name_);
    }
    auto target = resolve_seek_target(offset, origin, pos_, data_.size());
    if (!target) return target.error();
    pos_ = target.value();
    return pos_;
}

} // namespace lexis::io
