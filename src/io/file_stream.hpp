#pragma once

#include "io/byte_stream.hpp"

#include <fstream>

namespace lexis::io {

/// Byte stream over a plain file on disk.
class FileStream : public ByteStream {
    // Constructor key; only the factories can make one.
    struct Private { explicit Private() = default; };

public:
    static Result<std::unique_ptr<FileStream>> open(const fs::path& path);

    Result<std::string> read(
        std::optional<size_t> size = std::nullopt) override;
    Result<u64> seek(i64 offset,
                     SeekOrigin origin = SeekOrigin::Begin) override;
    u64 tell() const override { return pos_; }
    void close() override;
    bool closed() const override { return !file_.is_open(); }
    std::string name() const override { return path_.string(); }

    FileStream(Private, fs::path path, u64 size);

private:
    fs::path path_;
    std::ifstream file_;
    u64 size_ = 0;
    u64 pos_ = 0;
};

} // namespace lexis::io
