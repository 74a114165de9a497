#include <catch2/catch_test_macros.hpp>

#include "io/buffered_gzip_writer.hpp"
#include "io/codec.hpp"
#include "io/file_stream.hpp"
#include "io/gzip_stream.hpp"
#include "io/memory_stream.hpp"
#include "test_support.hpp"

using namespace lexis;
using namespace lexis::io;
using lexis::test::TempDir;
using lexis::test::gzip_bytes;
using lexis::test::write_file;

// ================================================================
// Byte streams
// ================================================================

TEST_CASE("Memory stream read and seek", "[io]") {
    MemoryStream stream("0123456789", "digits");

    CHECK(stream.read(3).value() == "012");
    CHECK(stream.tell() == 3);
    CHECK(stream.seek(-2, SeekOrigin::End).value() == 8);
    CHECK(stream.read().value() == "89");
    CHECK(stream.read(4).value().empty());
    CHECK(stream.seek(2, SeekOrigin::Begin).value() == 2);
    CHECK(stream.seek(3, SeekOrigin::Current).value() == 5);
    CHECK(stream.read(0).value().empty());
    CHECK(stream.read(2).value() == "56");

    auto negative = stream.seek(-1, SeekOrigin::Begin);
    REQUIRE_FALSE(negative.ok());
    CHECK(negative.error().is(ErrorKind::InvalidArgument));

    stream.close();
    CHECK(stream.closed());
    CHECK_FALSE(stream.read().ok());
}

TEST_CASE("File stream read and seek", "[io]") {
    TempDir dir;
    write_file(dir / "f.bin", "hello, world");

    auto opened = FileStream::open(dir / "f.bin");
    REQUIRE(opened.ok());
    auto& stream = *opened.value();

    CHECK(stream.read(5).value() == "hello");
    CHECK(stream.tell() == 5);
    CHECK(stream.read().value() == ", world");
    CHECK(stream.read(3).value().empty());

    // Reading to the end must not break later seeks.
    CHECK(stream.seek(-5, SeekOrigin::End).value() == 7);
    CHECK(stream.read(5).value() == "world");
    CHECK(stream.seek(-5, SeekOrigin::Current).value() == 7);
    CHECK(stream.read(1).value() == "w");

    stream.close();
    CHECK(stream.closed());

    auto missing = FileStream::open(dir / "missing.bin");
    REQUIRE_FALSE(missing.ok());
    CHECK(missing.error().is(ErrorKind::NotFound));
}

TEST_CASE("Gzip file stream positions are uncompressed offsets", "[io]") {
    TempDir dir;
    std::string text;
    for (int i = 0; i < 1000; i++) text += "line " + std::to_string(i) + "\n";
    write_file(dir / "lines.txt.gz", gzip_bytes(text));

    auto opened = GzipFileStream::open(dir / "lines.txt.gz");
    REQUIRE(opened.ok());
    auto& stream = *opened.value();

    CHECK(stream.read(7).value() == "line 0\n");
    CHECK(stream.tell() == 7);

    CHECK(stream.seek(-4, SeekOrigin::End).value() == text.size() - 4);
    CHECK(stream.read().value() == "999\n");

    CHECK(stream.seek(0).value() == 0);
    CHECK(stream.read().value() == text);

    auto missing = GzipFileStream::open(dir / "missing.gz");
    REQUIRE_FALSE(missing.ok());
    CHECK(missing.error().is(ErrorKind::NotFound));
}

TEST_CASE("gunzip inflates buffers in memory", "[io]") {
    CHECK(gunzip(gzip_bytes("abc")).value() == "abc");
    CHECK(gunzip(gzip_bytes("")).value().empty());

    // Concatenated members read as one stream.
    CHECK(gunzip(gzip_bytes("first ") + gzip_bytes("second")).value() ==
          "first second");

    auto truncated = gzip_bytes(std::string(1000, 'q'));
    truncated.resize(truncated.size() / 2);
    auto bad = gunzip(truncated, "half.gz");
    REQUIRE_FALSE(bad.ok());
    CHECK(bad.error().message.find("half.gz") != std::string::npos);

    CHECK_FALSE(gunzip("plain text, not gzip").ok());
}

// ================================================================
// BufferedCompressionWriter
// ================================================================

TEST_CASE("Compression writer batches writes", "[io][writer]") {
    TempDir dir;
    auto path = dir / "out.gz";

    auto opened = BufferedCompressionWriter::open(path, 6, 16);
    REQUIRE(opened.ok());
    auto& writer = *opened.value();
    CHECK(writer.buffer_size() == 16);

    REQUIRE(writer.write("abcd").ok());
    REQUIRE(writer.write("efgh").ok());
    CHECK(writer.buffered() == 8);

    // Does not fit: the first batch goes out, this one starts the next.
    REQUIRE(writer.write("0123456789").ok());
    CHECK(writer.buffered() == 10);

    // Per-call limit override.
    REQUIRE(writer.write("XY", 11).ok());
    CHECK(writer.buffered() == 2);

    REQUIRE(writer.flush().ok());
    CHECK(writer.buffered() == 0);

    REQUIRE(writer.write("tail").ok());
    REQUIRE(writer.close().ok());
    CHECK_FALSE(writer.is_open());
    REQUIRE(writer.close().ok());
    CHECK_FALSE(writer.write("late").ok());

    auto inflated = gunzip(lexis::test::read_file(path));
    REQUIRE(inflated.ok());
    CHECK(inflated.value() == "abcdefgh0123456789XYtail");
}

TEST_CASE("Compression writer flushes on destruction", "[io][writer]") {
    TempDir dir;
    auto path = dir / "scoped.gz";
    {
        auto opened = BufferedCompressionWriter::open(path);
        REQUIRE(opened.ok());
        REQUIRE(opened.value()->write("kept").ok());
    }
    CHECK(gunzip(lexis::test::read_file(path)).value() == "kept");
}

TEST_CASE("Compression writer rejects bad levels", "[io][writer]") {
    TempDir dir;
    auto bad = BufferedCompressionWriter::open(dir / "x.gz", 0);
    REQUIRE_FALSE(bad.ok());
    CHECK(bad.error().is(ErrorKind::InvalidArgument));
}

// ================================================================
// Codec
// ================================================================

TEST_CASE("Codec aliases", "[io][codec]") {
    CHECK(Codec::normalize_name("UTF-16 LE") == "utf16le");
    CHECK(Codec::open("utf-8").value().charset() == "UTF-8");
    CHECK(Codec::open("latin_1").value().charset() == "ISO-8859-1");
    CHECK(Codec::open("UTF16").value().unit_size() == 2);
    CHECK(Codec::open("utf-32-be").value().unit_size() == 4);

    auto unknown = Codec::open("klingon-8");
    REQUIRE_FALSE(unknown.ok());
    CHECK(unknown.error().is(ErrorKind::UnknownEncoding));
}

TEST_CASE("Codec leaves truncated sequences unconsumed", "[io][codec]") {
    auto codec = Codec::open("utf-8");
    REQUIRE(codec.ok());

    // "a" followed by the first two bytes of a three-byte character.
    auto decoded = codec.value().decode("a\xe4\xb8", DecodeErrors::Strict);
    REQUIRE(decoded.ok());
    CHECK(decoded.value().chars == U"a");
    CHECK(decoded.value().consumed == 1);

    auto whole = codec.value().decode("a\xe4\xb8\xad", DecodeErrors::Strict);
    REQUIRE(whole.ok());
    CHECK(whole.value().chars == U"a\u4e2d");
    CHECK(whole.value().consumed == 4);

    auto all = codec.value().decode_all("a\xe4\xb8");
    REQUIRE_FALSE(all.ok());
    CHECK(all.error().is(ErrorKind::DecodeError));
}

TEST_CASE("Codec error modes", "[io][codec]") {
    auto codec = Codec::open("utf-8");
    REQUIRE(codec.ok());
    std::string bytes = "ok\xff!";

    auto strict = codec.value().decode(bytes, DecodeErrors::Strict);
    REQUIRE_FALSE(strict.ok());
    CHECK(strict.error().is(ErrorKind::DecodeError));

    auto ignore = codec.value().decode(bytes, DecodeErrors::Ignore);
    REQUIRE(ignore.ok());
    CHECK(ignore.value().chars == U"ok!");

    auto replace = codec.value().decode(bytes, DecodeErrors::Replace);
    REQUIRE(replace.ok());
    CHECK(replace.value().chars == U"ok\ufffd!");
    CHECK(replace.value().consumed == bytes.size());

    CHECK(parse_decode_errors("replace") == DecodeErrors::Replace);
    CHECK_FALSE(parse_decode_errors("shout").has_value());
}

TEST_CASE("Codec round trips through UTF-8", "[io][codec]") {
    std::u32string text = U"caf\u00e9 \u4e2d\u6587 \U0001F600";
    auto utf8 = Codec::to_utf8(text);
    REQUIRE(utf8.ok());
    CHECK(utf8.value() == "caf\xc3\xa9 \xe4\xb8\xad\xe6\x96\x87 \xf0\x9f\x98\x80");

    auto latin = Codec::open("latin-1");
    REQUIRE(latin.ok());
    CHECK(latin.value().decode_all("caf\xe9").value() == U"caf\u00e9");
}
