#include "io/codec.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <spdlog/fmt/fmt.h>
#include <iconv.h>

namespace lexis::io {

namespace {

struct CharsetAlias {
    std::string_view name; ///< normalized
    const char* charset;
    size_t unit;
};

// utf16/utf32 without a BOM are read little-endian.
constexpr CharsetAlias kAliases[] = {
    {"utf8", "UTF-8", 1},
    {"u8", "UTF-8", 1},
    {"utf", "UTF-8", 1},
    {"utf16", "UTF-16LE", 2},
    {"utf16le", "UTF-16LE", 2},
    {"utf16be", "UTF-16BE", 2},
    {"utf32", "UTF-32LE", 4},
    {"utf32le", "UTF-32LE", 4},
    {"utf32be", "UTF-32BE", 4},
    {"latin1", "ISO-8859-1", 1},
    {"latin", "ISO-8859-1", 1},
    {"l1", "ISO-8859-1", 1},
    {"iso88591", "ISO-8859-1", 1},
    {"8859", "ISO-8859-1", 1},
    {"cp819", "ISO-8859-1", 1},
    {"ascii", "ASCII", 1},
    {"usascii", "ASCII", 1},
    {"cp1252", "CP1252", 1},
    {"windows1252", "CP1252", 1},
};

constexpr const char* kInternal = "UTF-32LE";

iconv_t as_cd(void* cd) {
    return static_cast<iconv_t>(cd);
}

void append_utf32le(std::u32string& out, const char* data, size_t len) {
    auto* p = reinterpret_cast<const unsigned char*>(data);
    for (size_t i = 0; i + 4 <= len; i += 4) {
        out.push_back(static_cast<char32_t>(p[i]) |
                      (static_cast<char32_t>(p[i + 1]) << 8) |
                      (static_cast<char32_t>(p[i + 2]) << 16) |
                      (static_cast<char32_t>(p[i + 3]) << 24));
    }
}

} // namespace

std::optional<DecodeErrors> parse_decode_errors(std::string_view name) {
    if (name == "strict") return DecodeErrors::Strict;
    if (name == "ignore") return DecodeErrors::Ignore;
    if (name == "replace") return DecodeErrors::Replace;
    return std::nullopt;
}

std::string Codec::normalize_name(std::string_view encoding) {
    std::string out;
    out.reserve(encoding.size());
    for (unsigned char c : encoding) {
        if (c == ' ' || c == '-' || c == '_') continue;
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

Codec::Codec(void* cd, std::string charset, size_t unit)
    : cd_(cd), charset_(std::move(charset)), unit_(unit) {}

Codec::~Codec() {
    if (cd_) iconv_close(as_cd(cd_));
}

Codec::Codec(Codec&& other) noexcept
    : cd_(other.cd_), charset_(std::move(other.charset_)), unit_(other.unit_) {
    other.cd_ = nullptr;
}

Codec& Codec::operator=(Codec&& other) noexcept {
    if (this != &other) {
        if (cd_) iconv_close(as_cd(cd_));
        cd_ = other.cd_;
        charset_ = std::move(other.charset_);
        unit_ = other.unit_;
        other.cd_ = nullptr;
    }
    return *this;
}

Result<Codec> Codec::open(std::string_view encoding) {
    auto key = normalize_name(encoding);
    std::string charset(encoding);
    size_t unit = 1;
    for (const auto& alias : kAliases) {
        if (alias.name == key) {
            charset = alias.charset;
            unit = alias.unit;
            break;
        }
    }

    iconv_t cd = iconv_open(kInternal, charset.c_str());
    if (cd == reinterpret_cast<iconv_t>(-1)) {
        return Error(ErrorKind::UnknownEncoding,
                     fmt::format("unknown encoding: {}", encoding));
    }
    return Codec(cd, std::move(charset), unit);
}

Result<Codec::Decoded> Codec::decode(std::string_view bytes,
                                     DecodeErrors errors) {
    // Start from the initial shift state every time.
    iconv(as_cd(cd_), nullptr, nullptr, nullptr, nullptr);

    Decoded out;
    out.chars.reserve(bytes.size());

    char* in = const_cast<char*>(bytes.data());
    size_t in_left = bytes.size();
    std::array<char, 16 * 1024> buf;

    while (in_left > 0) {
        char* outp = buf.data();
        size_t out_left = buf.size();
        size_t rc = iconv(as_cd(cd_), &in, &in_left, &outp, &out_left);
        append_utf32le(out.chars, buf.data(), buf.size() - out_left);
        if (rc != static_cast<size_t>(-1)) continue;

        if (errno == E2BIG) continue;
        if (errno == EINVAL) break; // truncated sequence at the end

        if (errno == EILSEQ) {
            size_t offset = bytes.size() - in_left;
            if (errors == DecodeErrors::Strict) {
                return Error(ErrorKind::DecodeError,
                             fmt::format("'{}' codec can't decode byte 0x{:02x} "
                                         "in position {}",
                                         charset_,
                                         static_cast<unsigned char>(*in),
                                         offset));
            }
            if (errors == DecodeErrors::Replace) out.chars.push_back(U'\uFFFD');
            size_t skip = std::min(unit_, in_left);
            in += skip;
            in_left -= skip;
            iconv(as_cd(cd_), nullptr, nullptr, nullptr, nullptr);
            continue;
        }

        return Error(ErrorKind::DecodeError,
                     fmt::format("iconv({}) failed: {}", charset_,
                                 std::strerror(errno)));
    }

    out.consumed = bytes.size() - in_left;
    return out;
}

Result<std::u32string> Codec::decode_all(std::string_view bytes,
                                         DecodeErrors errors) {
    auto decoded = decode(bytes, errors);
    if (!decoded) return decoded.error();
    if (decoded.value().consumed != bytes.size()) {
        if (errors == DecodeErrors::Strict) {
            return Error(ErrorKind::DecodeError,
                         fmt::format("'{}' codec can't decode bytes in position "
                                     "{}-{}: unexpected end of data",
                                     charset_, decoded.value().consumed,
                                     bytes.size() - 1));
        }
        if (errors == DecodeErrors::Replace) {
            decoded.value().chars.push_back(U'\uFFFD');
        }
    }
    return std::move(decoded.value().chars);
}

Result<std::string> Codec::to_utf8(std::u32string_view text) {
    std::string raw;
    raw.reserve(text.size() * 4);
    for (char32_t c : text) {
        raw.push_back(static_cast<char>(c & 0xFF));
        raw.push_back(static_cast<char>((c >> 8) & 0xFF));
        raw.push_back(static_cast<char>((c >> 16) & 0xFF));
        raw.push_back(static_cast<char>((c >> 24) & 0xFF));
    }

    iconv_t cd = iconv_open("UTF-8", kInternal);
    if (cd == reinterpret_cast<iconv_t>(-1)) {
        return Error(ErrorKind::UnknownEncoding, "iconv cannot produce UTF-8");
    }

    std::string out;
    char* in = raw.data();
    size_t in_left = raw.size();
    std::array<char, 16 * 1024> buf;
    while (in_left > 0) {
        char* outp = buf.data();
        size_t out_left = buf.size();
        size_t rc = iconv(cd, &in, &in_left, &outp, &out_left);
        out.append(buf.data(), buf.size() - out_left);
        if (rc == static_cast<size_t>(-1) && errno != E2BIG) {
            size_t index = (raw.size() - in_left) / 4;
            iconv_close(cd);
            return Error(ErrorKind::DecodeError,
                         fmt::format("cannot encode code point at index {} as "
                                     "UTF-8",
                                     index));
        }
    }
    iconv_close(cd);
    return out;
}

} // namespace lexis::io
