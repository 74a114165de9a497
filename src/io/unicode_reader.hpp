#pragma once

#include "io/byte_stream.hpp"
#include "io/codec.hpp"

#include <deque>
#include <string>
#include <string_view>
#include <vector>

namespace lexis::io {

/// True for every code point that ends a line: \n \r \v \f \x1c-\x1e \x85
/// U+2028 U+2029.
bool is_line_break(char32_t c);

/// Split `text` into lines; "\r\n" counts as one break. With `keepends` the
/// terminators stay attached. An empty input gives no lines.
std::vector<std::u32string> split_lines(std::u32string_view text,
                                        bool keepends = true);

/// Reader that decodes a byte stream into characters while still supporting
/// seek() and tell() in terms of byte positions of the underlying stream.
///
/// Characters are returned as UTF-32 code points. Sizes passed to read() and
/// readline() are byte counts; tell() and seek() are byte offsets.
/// Requires a stateless decoder, which holds for every encoding Codec knows.
class SeekableUnicodeStreamReader {
    struct Private { explicit Private() = default; };

public:
    /// Rewind `stream`, look for a byte-order mark and set up decoding.
    /// "utf16"/"utf32" are narrowed to the byte order the BOM names.
    static Result<std::unique_ptr<SeekableUnicodeStreamReader>> create(
        ByteStreamPtr stream, std::string_view encoding,
        DecodeErrors errors = DecodeErrors::Strict);

    // Non-copyable
    SeekableUnicodeStreamReader(const SeekableUnicodeStreamReader&) = delete;
    SeekableUnicodeStreamReader& operator=(const SeekableUnicodeStreamReader&) = delete;

    /// Decode up to `size` more bytes (all remaining when nullopt), prefixed
    /// by any characters readline() buffered.
    Result<std::u32string> read(std::optional<size_t> size = std::nullopt);

    /// Read one line, terminator included. When `size` is given, at most
    /// `size` bytes are read ahead and the line may come back incomplete.
    Result<std::u32string> readline(std::optional<size_t> size = std::nullopt);

    Result<std::vector<std::u32string>> readlines(bool keepends = true);

    /// Next line, or nullopt at end of stream.
    Result<std::optional<std::u32string>> next_line();

    Result<void> discard_line();

    /// Only SeekOrigin::Begin and SeekOrigin::End are supported. Discards
    /// all buffered data.
    Result<u64> seek(i64 offset, SeekOrigin origin = SeekOrigin::Begin);

    /// Move forward by exactly `offset` characters.
    Result<void> char_seek_forward(u64 offset);

    /// Byte position of the next character read() or readline() would
    /// return.
    Result<u64> tell();

    void close() { stream_->close(); }
    bool closed() const { return stream_->closed(); }
    std::string name() const { return stream_->name(); }

    const std::string& encoding() const { return encoding_; }
    DecodeErrors errors() const { return errors_; }
    std::optional<size_t> bom_length() const { return bom_length_; }

    /// Re-decode after every buffered tell() and compare with the buffer.
    static void set_debug_checks(bool enabled);
    static bool debug_checks();

    SeekableUnicodeStreamReader(Private, ByteStreamPtr stream,
                                std::string encoding, Codec codec,
                                DecodeErrors errors,
                                std::optional<size_t> bom_length);

private:
    /// Decode up to `size` bytes, ignoring the line buffer.
    Result<std::u32string> read_chars(std::optional<size_t> size);

    /// Decode the longest valid prefix of `bytes`.
    Result<Codec::Decoded> incr_decode(std::string_view bytes);

    /// Advance the underlying stream by `offset` characters, ignoring all
    /// buffers. `est_bytes` is the first guess of how many bytes that takes.
    Result<void> seek_chars(u64 offset, std::optional<u64> est_bytes);

    /// Step over the BOM when positioned at the very start.
    Result<void> skip_bom();

    void reset_buffers();

    ByteStreamPtr stream_;
    std::string encoding_;
    Codec codec_;
    DecodeErrors errors_;

    /// Bytes read but not decoded yet (a truncated trailing sequence).
    std::string byte_buffer_;

    /// Lines decoded by readline() but not returned yet; the last one may be
    /// incomplete. Empty when nothing is buffered.
    std::deque<std::u32string> line_buffer_;

    /// Byte offset where the read that filled line_buffer_ began.
    u64 rewind_checkpoint_ = 0;

    /// Characters returned since rewind_checkpoint_.
    u64 rewind_char_count_ = 0;

    std::optional<size_t> bom_length_;
};

} // namespace lexis::io
