#pragma once

#include "io/byte_stream.hpp"

namespace lexis::io {

/// Byte stream over an in-memory buffer (e.g. a whole archive entry).
class MemoryStream : public ByteStream {
public:
    explicit MemoryStream(std::string data, std::string name = "<memory>");

    Result<std::string> read(
        std::optional<size_t> size = std::nullopt) override;
    Result<u64> seek(i64 offset,
                     SeekOrigin origin = SeekOrigin::Begin) override;
    u64 tell() const override { return pos_; }
    void close() override { closed_ = true; }
    bool closed() const override { return closed_; }
    std::string name() const override { return name_; }

    size_t size() const { return data_.size(); }

private:
    std::string data_;
    std::string name_;
    u64 pos_ = 0;
    bool closed_ = false;
};

} // namespace lexis::io
