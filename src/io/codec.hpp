#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace lexis::io {

/// What to do with bytes that are not valid in the source encoding.
enum class DecodeErrors {
    Strict,  ///< fail with DecodeError
    Ignore,  ///< drop the offending code unit
    Replace, ///< emit U+FFFD for the offending code unit
};

std::optional<DecodeErrors> parse_decode_errors(std::string_view name);

/// Stateless decoder from a named byte encoding to UTF-32 code points,
/// backed by iconv. A multi-byte sequence cut off by the end of the input
/// is left unconsumed so the caller can retry once more bytes arrive.
class Codec {
public:
    struct Decoded {
        std::u32string chars;
        size_t consumed = 0; ///< bytes of input turned into `chars`
    };

    static Result<Codec> open(std::string_view encoding);

    ~Codec();
    Codec(Codec&& other) noexcept;
    Codec& operator=(Codec&& other) noexcept;
    Codec(const Codec&) = delete;
    Codec& operator=(const Codec&) = delete;

    Result<Decoded> decode(std::string_view bytes, DecodeErrors errors);

    /// Decode all of `bytes`; a truncated tail is a DecodeError.
    Result<std::u32string> decode_all(std::string_view bytes,
                                      DecodeErrors errors = DecodeErrors::Strict);

    /// iconv charset name in use, e.g. "UTF-16LE".
    const std::string& charset() const { return charset_; }

    /// Width of one code unit in bytes (1 for UTF-8, 2 for UTF-16, ...).
    size_t unit_size() const { return unit_; }

    /// Lowercase and strip ' ', '-' and '_': "UTF-16 LE" -> "utf16le".
    static std::string normalize_name(std::string_view encoding);

    /// Encode code points as UTF-8.
    static Result<std::string> to_utf8(std::u32string_view text);

private:
    Codec(void* cd, std::string charset, size_t unit);

    void* cd_ = nullptr; // iconv_t
    std::string charset_;
    size_t unit_ = 1;
};

} // namespace lexis::io
