#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <memory>
#include <optional>
#include <string>

namespace lexis::io {

enum class SeekOrigin {
    Begin,
    Current,
    End,
};

/// Abstract readable, seekable byte stream. Bytes travel in std::string.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    /// Read up to `size` bytes, or everything up to the end when `size` is
    /// nullopt. Returns fewer bytes (possibly none) at end of stream.
    virtual Result<std::string> read(
        std::optional<size_t> size = std::nullopt) = 0;

    /// Move the read position. Returns the new absolute position.
    virtual Result<u64> seek(i64 offset,
                             SeekOrigin origin = SeekOrigin::Begin) = 0;

    /// Current absolute read position.
    virtual u64 tell() const = 0;

    virtual void close() = 0;
    virtual bool closed() const = 0;

    /// Human-readable name (a path, or an archive entry).
    virtual std::string name() const = 0;
};

using ByteStreamPtr = std::unique_ptr<ByteStream>;

/// Resolve a seek request against the current position and stream size.
Result<u64> resolve_seek_target(i64 offset, SeekOrigin origin, u64 current,
                                u64 size);

} // namespace lexis::io
