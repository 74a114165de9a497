#include <catch2/catch_test_macros.hpp>

#include "io/codec.hpp"
#include "io/file_stream.hpp"
#include "io/gzip_stream.hpp"
#include "io/memory_stream.hpp"
#include "io/unicode_reader.hpp"
#include "test_support.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace lexis;
using namespace lexis::io;
using namespace lexis::test;

namespace {

const std::u32string kUnicodeText =
    U"This is a test file.\n"
    U"It is encoded in UTF-8.\r\n"
    U"Mixed widths: \u00e9 \u00fc \u4e2d\u6587 \U0001F600 \u00df.\n"
    U"\r"
    U"A separator\u2028inside, and a NEL\u0085too.\n"
    U"\u4e2d\u6587\u4e2d\u6587\u4e2d\u6587\u4e2d\u6587\u4e2d\u6587\u4e2d\u6587\n"
    U"Last line without a newline";

const std::u32string kLatinText =
    U"Caf\u00e9 cr\u00e8me\n"
    U"na\u00efve r\u00e9sum\u00e9\r\n"
    U"\u00bfQu\u00e9?\r"
    U"\u00a9 \u00ae \u00b5\n"
    U"last";

std::string to_latin1(const std::u32string& text) {
    std::string out;
    for (char32_t c : text) out.push_back(static_cast<char>(c));
    return out;
}

std::string to_utf8(const std::u32string& text) {
    auto bytes = Codec::to_utf8(text);
    REQUIRE(bytes.ok());
    return bytes.value();
}

std::unique_ptr<SeekableUnicodeStreamReader> make_reader(
    const std::string& bytes, const char* encoding,
    DecodeErrors errors = DecodeErrors::Strict) {
    auto reader = SeekableUnicodeStreamReader::create(
        std::make_unique<MemoryStream>(bytes, "test"), encoding, errors);
    REQUIRE(reader.ok());
    return std::move(reader.value());
}

struct EncodedText {
    const char* encoding;
    std::u32string text;
    std::string bytes;
};

std::vector<EncodedText> samples() {
    return {
        {"utf-8", kUnicodeText, to_utf8(kUnicodeText)},
        {"latin-1", kLatinText, to_latin1(kLatinText)},
    };
}

} // namespace

// ================================================================
// Line splitting
// ================================================================

TEST_CASE("Line splitting follows the full line break set", "[unicode]") {
    auto lines = split_lines(U"a\r\nb\rc\u2028d\x0b" U"e\n\nf");
    REQUIRE(lines.size() == 7);
    CHECK(lines[0] == U"a\r\n");
    CHECK(lines[1] == U"b\r");
    CHECK(lines[2] == U"c\u2028");
    CHECK(lines[3] == U"d\x0b");
    CHECK(lines[4] == U"e\n");
    CHECK(lines[5] == U"\n");
    CHECK(lines[6] == U"f");

    auto bare = split_lines(U"x\r\ny\n", false);
    REQUIRE(bare.size() == 2);
    CHECK(bare[0] == U"x");
    CHECK(bare[1] == U"y");

    CHECK(split_lines(U"").empty());
    CHECK(is_line_break(U'\x1e'));
    CHECK_FALSE(is_line_break(U'\t'));
}

// ================================================================
// Reading
// ================================================================

TEST_CASE("Unicode reader read returns the full decode", "[unicode]") {
    for (const auto& sample : samples()) {
        auto reader = make_reader(sample.bytes, sample.encoding);
        auto all = reader->read();
        REQUIRE(all.ok());
        CHECK(all.value() == sample.text);
        CHECK(reader->read().value().empty());
    }
}

TEST_CASE("Unicode reader readline returns each line", "[unicode]") {
    for (const auto& sample : samples()) {
        auto reader = make_reader(sample.bytes, sample.encoding);
        std::vector<std::u32string> lines;
        while (true) {
            auto line = reader->next_line();
            REQUIRE(line.ok());
            if (!line.value()) break;
            lines.push_back(*line.value());
        }
        CHECK(lines == split_lines(sample.text));
    }
}

TEST_CASE("Mixed read and readline calls cover the text exactly", "[unicode]") {
    for (const auto& sample : samples()) {
        for (size_t size : {1u, 2u, 3u, 5u, 7u, 13u, 40u}) {
            auto reader = make_reader(sample.bytes, sample.encoding);
            std::u32string collected;
            while (true) {
                auto line = reader->readline();
                REQUIRE(line.ok());
                auto chunk = reader->read(size);
                REQUIRE(chunk.ok());
                if (line.value().empty() && chunk.value().empty()) break;
                collected += line.value();
                collected += chunk.value();
            }
            INFO("encoding " << sample.encoding << ", size " << size);
            CHECK(collected == sample.text);
        }
    }
}

TEST_CASE("Size-limited readline may return partial lines", "[unicode]") {
    auto reader = make_reader("abcdef\nxyz", "utf-8");
    CHECK(reader->readline(2).value() == U"ab");
    CHECK(reader->readline().value() == U"cdef\n");
    CHECK(reader->readline(100).value() == U"xyz");
    CHECK(reader->readline().value().empty());
}

TEST_CASE("Size-limited reads never split a character", "[unicode]") {
    std::u32string text = U"\u4e2d\u6587\U0001F600";
    auto reader = make_reader(to_utf8(text), "utf-8");
    std::u32string collected;
    while (true) {
        auto chunk = reader->read(1);
        REQUIRE(chunk.ok());
        if (chunk.value().empty()) break;
        CHECK(chunk.value().size() == 1);
        collected += chunk.value();
    }
    CHECK(collected == text);
}

TEST_CASE("readlines and discard_line", "[unicode]") {
    auto reader = make_reader("one\ntwo\r\nthree", "ascii");
    REQUIRE(reader->discard_line().ok());
    auto rest = reader->readlines(false);
    REQUIRE(rest.ok());
    CHECK(rest.value() == std::vector<std::u32string>{U"two", U"three"});
}

// ================================================================
// Seek and tell
// ================================================================

TEST_CASE("tell reports the byte offset of the next character", "[unicode]") {
    SeekableUnicodeStreamReader::set_debug_checks(true);
    auto bytes = to_utf8(U"h\u00e9llo\nw\u00f6rld\n\u4e2d\n");
    auto reader = make_reader(bytes, "utf-8");

    CHECK(reader->tell().value() == 0);
    CHECK(reader->readline().value() == U"h\u00e9llo\n");
    CHECK(reader->tell().value() == 7);
    CHECK(reader->readline().value() == U"w\u00f6rld\n");
    CHECK(reader->tell().value() == 14);
    CHECK(reader->readline().value() == U"\u4e2d\n");
    CHECK(reader->tell().value() == bytes.size());
}

TEST_CASE("seek to tell resumes at the same character", "[unicode]") {
    SeekableUnicodeStreamReader::set_debug_checks(true);
    for (const auto& sample : samples()) {
        for (size_t lines_first : {0u, 1u, 2u, 3u, 5u}) {
            for (size_t chars_after : {0u, 1u, 4u}) {
                auto reader = make_reader(sample.bytes, sample.encoding);
                for (size_t i = 0; i < lines_first; i++) {
                    REQUIRE(reader->readline().ok());
                }
                if (chars_after > 0) REQUIRE(reader->read(chars_after).ok());

                auto pos = reader->tell();
                REQUIRE(pos.ok());
                auto rest = reader->read();
                REQUIRE(rest.ok());

                REQUIRE(reader->seek(static_cast<i64>(pos.value())).ok());
                auto again = reader->read();
                REQUIRE(again.ok());
                CHECK(again.value() == rest.value());

                // The position is a real byte offset into the encoded text.
                auto fresh = Codec::open(sample.encoding);
                REQUIRE(fresh.ok());
                auto tail = fresh.value().decode_all(
                    std::string_view(sample.bytes).substr(pos.value()));
                REQUIRE(tail.ok());
                CHECK(tail.value() == rest.value());
            }
        }
    }
}

TEST_CASE("seek from the end", "[unicode]") {
    auto reader = make_reader("abc\ndef\n", "utf-8");
    REQUIRE(reader->readline().ok());
    CHECK(reader->seek(-4, SeekOrigin::End).value() == 4);
    CHECK(reader->read().value() == U"def\n");
}

TEST_CASE("Relative seeks are rejected", "[unicode]") {
    auto reader = make_reader("abc", "utf-8");
    auto seeked = reader->seek(1, SeekOrigin::Current);
    REQUIRE_FALSE(seeked.ok());
    CHECK(seeked.error().is(ErrorKind::UnsupportedOperation));
}

TEST_CASE("char_seek_forward lands on the requested character", "[unicode]") {
    SeekableUnicodeStreamReader::set_debug_checks(true);
    for (const auto& sample : samples()) {
        for (size_t n = 0; n <= sample.text.size(); n++) {
            auto reader = make_reader(sample.bytes, sample.encoding);
            REQUIRE(reader->char_seek_forward(n).ok());
            auto rest = reader->read();
            REQUIRE(rest.ok());
            INFO("encoding " << sample.encoding << ", n " << n);
            CHECK(rest.value() == sample.text.substr(n));
        }
    }
}

TEST_CASE("char_seek_forward counts from the current line", "[unicode]") {
    auto reader = make_reader(to_utf8(U"\u00e9t\u00e9\nhiver\n"), "utf-8");
    CHECK(reader->readline().value() == U"\u00e9t\u00e9\n");
    REQUIRE(reader->char_seek_forward(2).ok());
    CHECK(reader->read().value() == U"ver\n");
}

TEST_CASE("char_seek_forward past the end stops at the end", "[unicode]") {
    auto reader = make_reader("short", "utf-8");
    REQUIRE(reader->char_seek_forward(100).ok());
    CHECK(reader->read().value().empty());
    CHECK(reader->tell().value() == 5);
}

TEST_CASE("tell and seek in Ignore mode skip invalid bytes in later lines", "[unicode]") {
    SeekableUnicodeStreamReader::set_debug_checks(true);
    std::string bytes = "ab\ncd\xff" "ef\ngh\n";
    auto reader = make_reader(bytes, "utf-8", DecodeErrors::Ignore);

    CHECK(reader->readline().value() == U"ab\n");
    auto pos = reader->tell();
    REQUIRE(pos.ok());
    CHECK(pos.value() == 3);
    CHECK(reader->read().value() == U"cdef\ngh\n");

    REQUIRE(reader->seek(static_cast<i64>(pos.value())).ok());
    CHECK(reader->readline().value() == U"cdef\n");
    CHECK(reader->tell().value() == 9);
    CHECK(reader->read().value() == U"gh\n");

    REQUIRE(reader->seek(0).ok());
    REQUIRE(reader->readline().ok());
    REQUIRE(reader->char_seek_forward(2).ok());
    CHECK(reader->read().value() == U"ef\ngh\n");
}

TEST_CASE("tell and seek in Replace mode keep replacement characters", "[unicode]") {
    SeekableUnicodeStreamReader::set_debug_checks(true);
    std::string bytes = "ab\ncd\xff" "ef\ngh\n";
    auto reader = make_reader(bytes, "utf-8", DecodeErrors::Replace);

    CHECK(reader->readline().value() == U"ab\n");
    auto pos = reader->tell();
    REQUIRE(pos.ok());
    CHECK(pos.value() == 3);
    CHECK(reader->read().value() == U"cd\ufffdef\ngh\n");

    REQUIRE(reader->seek(static_cast<i64>(pos.value())).ok());
    CHECK(reader->read().value() == U"cd\ufffdef\ngh\n");

    REQUIRE(reader->seek(0).ok());
    REQUIRE(reader->readline().ok());
    REQUIRE(reader->char_seek_forward(3).ok());
    CHECK(reader->read().value() == U"ef\ngh\n");
}

// ================================================================
// File-backed readers
// ================================================================

namespace {

std::unique_ptr<SeekableUnicodeStreamReader> make_file_reader(
    const fs::path& path, const char* encoding) {
    auto stream = FileStream::open(path);
    REQUIRE(stream.ok());
    auto reader =
        SeekableUnicodeStreamReader::create(std::move(stream.value()), encoding);
    REQUIRE(reader.ok());
    return std::move(reader.value());
}

std::unique_ptr<SeekableUnicodeStreamReader> make_gzip_reader(
    const fs::path& path, const char* encoding) {
    auto stream = GzipFileStream::open(path);
    REQUIRE(stream.ok());
    auto reader =
        SeekableUnicodeStreamReader::create(std::move(stream.value()), encoding);
    REQUIRE(reader.ok());
    return std::move(reader.value());
}

} // namespace

TEST_CASE("File reader char_seek_forward far past the end stops at the end", "[unicode]") {
    TempDir dir;
    write_file(dir / "short.txt", "short");
    auto reader = make_file_reader(dir / "short.txt", "utf-8");

    REQUIRE(reader->char_seek_forward(u64{1} << 50).ok());
    CHECK(reader->read().value().empty());
    CHECK(reader->tell().value() == 5);
}

TEST_CASE("File reader seek to tell resumes at the same character", "[unicode]") {
    SeekableUnicodeStreamReader::set_debug_checks(true);
    TempDir dir;
    auto bytes = to_utf8(kUnicodeText);
    write_file(dir / "sample.txt", bytes);
    auto reader = make_file_reader(dir / "sample.txt", "utf-8");

    REQUIRE(reader->readline().ok());
    REQUIRE(reader->readline().ok());
    auto pos = reader->tell();
    REQUIRE(pos.ok());
    CHECK(pos.value() == 46);
    auto rest = reader->read();
    REQUIRE(rest.ok());

    REQUIRE(reader->seek(static_cast<i64>(pos.value())).ok());
    CHECK(reader->read().value() == rest.value());

    auto codec = Codec::open("utf-8");
    REQUIRE(codec.ok());
    auto tail = codec.value().decode_all(std::string_view(bytes).substr(pos.value()));
    REQUIRE(tail.ok());
    CHECK(tail.value() == rest.value());
}

TEST_CASE("Gzip reader seek to tell resumes at the same character", "[unicode]") {
    SeekableUnicodeStreamReader::set_debug_checks(true);
    TempDir dir;
    auto bytes = to_utf8(kUnicodeText);
    write_file(dir / "sample.txt.gz", gzip_bytes(bytes));
    auto reader = make_gzip_reader(dir / "sample.txt.gz", "utf-8");

    CHECK(reader->readline().value() == U"This is a test file.\n");
    auto pos = reader->tell();
    REQUIRE(pos.ok());
    CHECK(pos.value() == 21);
    CHECK(reader->readline().value() == U"It is encoded in UTF-8.\r\n");

    REQUIRE(reader->seek(static_cast<i64>(pos.value())).ok());
    CHECK(reader->readline().value() == U"It is encoded in UTF-8.\r\n");

    REQUIRE(reader->char_seek_forward(6).ok());
    CHECK(reader->readline().value() == U"widths: \u00e9 \u00fc \u4e2d\u6587 \U0001F600 \u00df.\n");
}

// ================================================================
// Byte-order marks and errors
// ================================================================

TEST_CASE("UTF-8 byte-order marks are skipped", "[unicode]") {
    SeekableUnicodeStreamReader::set_debug_checks(true);
    auto reader = make_reader("\xEF\xBB\xBF" "ab\ncd\n", "utf8");
    CHECK(reader->bom_length() == 3u);
    CHECK(reader->readline().value() == U"ab\n");
    CHECK(reader->tell().value() == 6);
    CHECK(reader->read().value() == U"cd\n");

    REQUIRE(reader->seek(0).ok());
    CHECK(reader->read().value() == U"ab\ncd\n");
}

TEST_CASE("UTF-16 byte-order marks select the byte order", "[unicode]") {
    std::string le("\xFF\xFE" "a\0b\0\n\0c\0", 10);
    auto little = make_reader(le, "utf-16");
    CHECK(little->encoding() == "utf16-le");
    CHECK(little->bom_length() == 2u);
    CHECK(little->readline().value() == U"ab\n");
    CHECK(little->readline().value() == U"c");

    std::string be("\xFE\xFF" "\0a\0b", 6);
    auto big = make_reader(be, "UTF-16");
    CHECK(big->encoding() == "utf16-be");
    CHECK(big->read().value() == U"ab");

    auto plain = make_reader(std::string("a\0", 2), "utf-16");
    CHECK_FALSE(plain->bom_length().has_value());
    CHECK(plain->read().value() == U"a");
}

TEST_CASE("Invalid bytes follow the error mode", "[unicode]") {
    std::string bytes = "ok\xff\nnext\n";

    auto strict = make_reader(bytes, "utf-8");
    auto failed = strict->readline();
    REQUIRE_FALSE(failed.ok());
    CHECK(failed.error().is(ErrorKind::DecodeError));

    auto replace = make_reader(bytes, "utf-8", DecodeErrors::Replace);
    CHECK(replace->readline().value() == U"ok\ufffd\n");
    CHECK(replace->readline().value() == U"next\n");

    auto ignore = make_reader(bytes, "utf-8", DecodeErrors::Ignore);
    CHECK(ignore->read().value() == U"ok\nnext\n");
}

TEST_CASE("Unknown encodings are rejected", "[unicode]") {
    auto reader = SeekableUnicodeStreamReader::create(
        std::make_unique<MemoryStream>("abc"), "no-such-codec");
    REQUIRE_FALSE(reader.ok());
    CHECK(reader.error().is(ErrorKind::UnknownEncoding));
}

TEST_CASE("Closing passes through to the stream", "[unicode]") {
    auto reader = make_reader("abc", "utf-8");
    CHECK(reader->name() == "test");
    CHECK_FALSE(reader->closed());
    reader->close();
    CHECK(reader->closed());
}
