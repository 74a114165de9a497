#include "io/unicode_reader.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <spdlog/spdlog.h>

namespace lexis::io {

namespace {

#ifdef NDEBUG
std::atomic<bool> g_debug_checks{false};
#else
std::atomic<bool> g_debug_checks{true};
#endif

constexpr size_t kInitialLineRead = 72;
constexpr size_t kMaxLineRead = 8000;
constexpr size_t kCheckBytes = 50;

struct BomVariant {
    std::string_view bytes;
    const char* narrowed; ///< nullptr keeps the given encoding
};

struct BomEntry {
    std::string_view encoding; ///< normalized name
    std::array<BomVariant, 2> variants;
};

const std::array<BomEntry, 7> kBomTable = {{
    {"utf8", {{{"\xEF\xBB\xBF", nullptr}, {}}}},
    {"utf16",
     {{{std::string_view("\xFF\xFE", 2), "utf16-le"},
       {std::string_view("\xFE\xFF", 2), "utf16-be"}}}},
    {"utf16le", {{{std::string_view("\xFF\xFE", 2), nullptr}, {}}}},
    {"utf16be", {{{std::string_view("\xFE\xFF", 2), nullptr}, {}}}},
    {"utf32",
     {{{std::string_view("\xFF\xFE\x00\x00", 4), "utf32-le"},
       {std::string_view("\x00\x00\xFE\xFF", 4), "utf32-be"}}}},
    {"utf32le", {{{std::string_view("\xFF\xFE\x00\x00", 4), nullptr}, {}}}},
    {"utf32be", {{{std::string_view("\x00\x00\xFE\xFF", 4), nullptr}, {}}}},
}};

bool starts_with(std::u32string_view s, std::u32string_view prefix) {
    return s.size() >= prefix.size() &&
           s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

bool is_line_break(char32_t c) {
    switch (c) {
    case U'\n':
    case U'\r':
    case U'\v':
    case U'\f':
    case U'\x1c':
    case U'\x1d':
    case U'\x1e':
    case U'\x85':
    case U'\u2028':
    case U'\u2029':
        return true;
    default:
        return false;
    }
}

std::vector<std::u32string> split_lines(std::u32string_view text,
                                        bool keepends) {
    std::vector<std::u32string> lines;
    size_t start = 0;
    size_t i = 0;
    while (i < text.size()) {
        if (!is_line_break(text[i])) {
            ++i;
            continue;
        }
        size_t eol = i;
        if (text[i] == U'\r' && i + 1 < text.size() && text[i + 1] == U'\n') {
            ++i;
        }
        ++i;
        lines.emplace_back(text.substr(start, (keepends ? i : eol) - start));
        start = i;
    }
    if (start < text.size()) lines.emplace_back(text.substr(start));
    return lines;
}

void SeekableUnicodeStreamReader::set_debug_checks(bool enabled) {
    g_debug_checks.store(enabled);
}

bool SeekableUnicodeStreamReader::debug_checks() {
    return g_debug_checks.load();
}

SeekableUnicodeStreamReader::SeekableUnicodeStreamReader(
    Private, ByteStreamPtr stream, std::string encoding, Codec codec,
    DecodeErrors errors, std::optional<size_t> bom_length)
    : stream_(std::move(stream)),
      encoding_(std::move(encoding)),
      codec_(std::move(codec)),
      errors_(errors),
      bom_length_(bom_length) {}

Result<std::unique_ptr<SeekableUnicodeStreamReader>>
SeekableUnicodeStreamReader::create(ByteStreamPtr stream,
                                    std::string_view encoding,
                                    DecodeErrors errors) {
    if (!stream) {
        return Error(ErrorKind::InvalidArgument, "null stream");
    }
    auto rewound = stream->seek(0);
    if (!rewound) return rewound.error();

    std::string effective(encoding);
    std::optional<size_t> bom_length;

    auto key = Codec::normalize_name(encoding);
    auto entry = std::find_if(kBomTable.begin(), kBomTable.end(),
                              [&](const BomEntry& e) { return e.encoding == key; });
    if (entry != kBomTable.end()) {
        auto prefix = stream->read(16);
        if (!prefix) return prefix.error();
        auto back = stream->seek(0);
        if (!back) return back.error();

        for (const auto& variant : entry->variants) {
            if (variant.bytes.empty()) continue;
            if (prefix.value().compare(0, variant.bytes.size(), variant.bytes) == 0) {
                if (variant.narrowed) effective = variant.narrowed;
                bom_length = variant.bytes.size();
                break;
            }
        }
    }

    auto codec = Codec::open(effective);
    if (!codec) return codec.error();

    spdlog::trace("unicode reader on {}: encoding {} ({}), bom {}",
                  stream->name(), effective, codec.value().charset(),
                  bom_length.value_or(0));

    return std::make_unique<SeekableUnicodeStreamReader>(
        Private{}, std::move(stream), std::move(effective),
        std::move(codec.value()), errors, bom_length);
}

// ----------------------------------------------------------------
// Reading
// ----------------------------------------------------------------

Result<std::u32string> SeekableUnicodeStreamReader::read(
    std::optional<size_t> size) {
    auto chars = read_chars(size);
    if (!chars) return chars;

    if (!line_buffer_.empty()) {
        std::u32string joined;
        for (auto& line : line_buffer_) joined += line;
        joined += chars.value();
        line_buffer_.clear();
        rewind_char_count_ = 0;
        return joined;
    }
    return chars;
}

Result<std::u32string> SeekableUnicodeStreamReader::readline(
    std::optional<size_t> size) {
    // A complete line is already buffered. The last element may be partial,
    // so it is left for the loop below.
    if (line_buffer_.size() > 1) {
        std::u32string line = std::move(line_buffer_.front());
        line_buffer_.pop_front();
        rewind_char_count_ += line.size();
        return line;
    }

    size_t readsize = (size && *size > 0) ? *size : kInitialLineRead;
    std::u32string chars;
    if (!line_buffer_.empty()) {
        chars = std::move(line_buffer_.back());
        line_buffer_.clear();
    }

    std::u32string line;
    while (true) {
        auto bom = skip_bom();
        if (!bom) return bom.error();
        u64 startpos = stream_->tell() - byte_buffer_.size();

        auto fresh = read_chars(readsize);
        if (!fresh) return fresh.error();
        std::u32string new_chars = std::move(fresh.value());

        // A '\r' may be the first half of "\r\n".
        if (!new_chars.empty() && new_chars.back() == U'\r') {
            auto extra = read_chars(1);
            if (!extra) return extra.error();
            new_chars += extra.value();
        }

        chars += new_chars;
        auto lines = split_lines(chars, true);
        if (lines.size() > 1) {
            line = std::move(lines.front());
            line_buffer_.assign(std::make_move_iterator(lines.begin() + 1),
                                std::make_move_iterator(lines.end()));
            size_t rest = chars.size() - line.size();
            rewind_char_count_ = new_chars.size() > rest ? new_chars.size() - rest : 0;
            rewind_checkpoint_ = startpos;
            break;
        }
        if (lines.size() == 1 && !lines.front().empty() &&
            is_line_break(lines.front().back())) {
            line = std::move(lines.front());
            break;
        }

        if (new_chars.empty() || size) {
            line = std::move(chars);
            break;
        }

        // Read successively larger blocks of text.
        if (readsize < kMaxLineRead) readsize *= 2;
    }

    return line;
}

Result<std::vector<std::u32string>> SeekableUnicodeStreamReader::readlines(
    bool keepends) {
    auto text = read();
    if (!text) return text.error();
    return split_lines(text.value(), keepends);
}

Result<std::optional<std::u32string>> SeekableUnicodeStreamReader::next_line() {
    auto line = readline();
    if (!line) return line.error();
    if (line.value().empty()) return std::optional<std::u32string>();
    return std::optional<std::u32string>(std::move(line.value()));
}

Result<void> SeekableUnicodeStreamReader::discard_line() {
    if (line_buffer_.size() > 1) {
        rewind_char_count_ += line_buffer_.front().size();
        line_buffer_.pop_front();
        return {};
    }
    auto line = readline();
    if (!line) return line.error();
    return {};
}

Result<std::u32string> SeekableUnicodeStreamReader::read_chars(
    std::optional<size_t> size) {
    if (size && *size == 0) return std::u32string();

    auto bom = skip_bom();
    if (!bom) return bom.error();

    auto fresh = stream_->read(size);
    if (!fresh) return fresh.error();
    std::string bytes = byte_buffer_ + fresh.value();

    auto decoded = incr_decode(bytes);
    if (!decoded) return decoded.error();

    // Got bytes but not one whole character: keep reading a byte at a time.
    if (size && decoded.value().chars.empty() && !fresh.value().empty()) {
        while (decoded.value().chars.empty()) {
            auto more = stream_->read(1);
            if (!more) return more.error();
            if (more.value().empty()) break;
            bytes += more.value();
            decoded = incr_decode(bytes);
            if (!decoded) return decoded.error();
        }
    }

    byte_buffer_ = bytes.substr(decoded.value().consumed);
    return std::move(decoded.value().chars);
}

Result<Codec::Decoded> SeekableUnicodeStreamReader::incr_decode(
    std::string_view bytes) {
    return codec_.decode(bytes, errors_);
}

Result<void> SeekableUnicodeStreamReader::skip_bom() {
    if (bom_length_ && stream_->tell() == 0) {
        auto skipped = stream_->read(*bom_length_);
        if (!skipped) return skipped.error();
    }
    return {};
}

// ----------------------------------------------------------------
// Seek and tell
// ----------------------------------------------------------------

void SeekableUnicodeStreamReader::reset_buffers() {
    line_buffer_.clear();
    byte_buffer_.clear();
    rewind_char_count_ = 0;
}

Result<u64> SeekableUnicodeStreamReader::seek(i64 offset, SeekOrigin origin) {
    if (origin == SeekOrigin::Current) {
        return Error(ErrorKind::UnsupportedOperation,
                     "Relative seek is not supported for "
                     "SeekableUnicodeStreamReader; use char_seek_forward() "
                     "instead");
    }
    auto pos = stream_->seek(offset, origin);
    if (!pos) return pos;

    reset_buffers();
    rewind_checkpoint_ = stream_->tell();
    return pos;
}

Result<void> SeekableUnicodeStreamReader::char_seek_forward(u64 offset) {
    auto pos = tell();
    if (!pos) return pos.error();
    auto cleared = seek(static_cast<i64>(pos.value()));
    if (!cleared) return cleared.error();
    return seek_chars(offset, std::nullopt);
}

Result<void> SeekableUnicodeStreamReader::seek_chars(
    u64 offset, std::optional<u64> est_bytes) {
    auto bom = skip_bom();
    if (!bom) return bom.error();

    u64 est = est_bytes.value_or(offset);
    std::string bytes;

    auto rewind_unused = [&](size_t consumed) -> Result<void> {
        auto back = stream_->seek(-static_cast<i64>(bytes.size() - consumed),
                                  SeekOrigin::Current);
        if (!back) return back.error();
        return {};
    };

    while (true) {
        size_t want = est > bytes.size() ? static_cast<size_t>(est - bytes.size()) : 0;
        auto fresh = stream_->read(want);
        if (!fresh) return fresh.error();
        bytes += fresh.value();

        auto decoded = incr_decode(bytes);
        if (!decoded) return decoded.error();
        u64 count = decoded.value().chars.size();

        if (count == offset) {
            return rewind_unused(decoded.value().consumed);
        }

        // Overshot: narrow the window over bytes already in hand. Every
        // character takes at least one byte, so this never undershoots.
        if (count > offset) {
            est = std::min<u64>(est, bytes.size());
            while (count > offset) {
                est -= count - offset;
                decoded = incr_decode(std::string_view(bytes).substr(0, est));
                if (!decoded) return decoded.error();
                count = decoded.value().chars.size();
            }
            return rewind_unused(decoded.value().consumed);
        }

        // End of stream before `offset` characters: stop at the end.
        if (want > 0 && fresh.value().empty()) {
            return rewind_unused(decoded.value().consumed);
        }

        est += offset - count;
    }
}

Result<u64> SeekableUnicodeStreamReader::tell() {
    if (line_buffer_.empty()) {
        return stream_->tell() - byte_buffer_.size();
    }

    // The buffered lines were decoded from bytes starting at
    // rewind_checkpoint_; walk forward rewind_char_count_ characters from
    // there, then put the stream back where it was.
    u64 orig_filepos = stream_->tell();

    u64 bytes_read = (orig_filepos - byte_buffer_.size()) - rewind_checkpoint_;
    u64 buf_size = 0;
    for (const auto& line : line_buffer_) buf_size += line.size();
    u64 total_chars = rewind_char_count_ + buf_size;
    u64 est_bytes = total_chars ? bytes_read * rewind_char_count_ / total_chars : 0;

    auto moved = stream_->seek(static_cast<i64>(rewind_checkpoint_));
    if (!moved) return moved.error();
    auto walked = seek_chars(rewind_char_count_, est_bytes);
    if (!walked) return walked.error();
    u64 filepos = stream_->tell();

    if (debug_checks()) {
        auto ahead = stream_->read(kCheckBytes);
        if (!ahead) return ahead.error();
        // Decode as the buffer was; Strict becomes Replace past its end.
        auto check_errors =
            errors_ == DecodeErrors::Strict ? DecodeErrors::Replace : errors_;
        auto check1 = codec_.decode(ahead.value(), check_errors);
        if (!check1) return check1.error();

        std::u32string check2;
        for (const auto& line : line_buffer_) check2 += line;

        const auto& c1 = check1.value().chars;
        if (!starts_with(c1, check2) && !starts_with(check2, c1)) {
            spdlog::error("{}: tell() computed position {} does not match "
                          "the buffered text",
                          stream_->name(), filepos);
            auto restored = stream_->seek(static_cast<i64>(orig_filepos));
            if (!restored) return restored.error();
            return Error(ErrorKind::InconsistentState,
                         "tell() consistency check failed on " + stream_->name());
        }
    }

    auto restored = stream_->seek(static_cast<i64>(orig_filepos));
    if (!restored) return restored.error();
    return filepos;
}

} // namespace lexis::io
