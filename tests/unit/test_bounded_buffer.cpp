// test_bounded_buffer.cpp - Unit tests for the capped output buffer

#include <catch2/catch_test_macros.hpp>
#include <codebox/bounded_buffer.h>

using namespace codebox;

TEST_CASE("BoundedBuffer - Capacity", "[output][buffer]") {
    SECTION("Writes under the cap are kept verbatim") {
        BoundedBuffer buffer(16);
        buffer.Append("hello\n");
        buffer.Append("world\n");

        REQUIRE(buffer.Data() == "hello\nworld\n");
        REQUIRE_FALSE(buffer.IsTruncated());
        REQUIRE(buffer.Render() == "hello\nworld\n");
    }

    SECTION("Bytes past the cap are counted, not stored") {
        BoundedBuffer buffer(8);
        buffer.Append("0123456789");
        buffer.Append("abc");

        REQUIRE(buffer.Data() == "01234567");
        REQUIRE(buffer.IsTruncated());
        REQUIRE(buffer.DroppedBytes() == 5);
    }

    SECTION("Render appends a truncation marker") {
        BoundedBuffer buffer(4);
        buffer.Append("abcdef");

        REQUIRE(buffer.Render() == "abcd\n... [output truncated, 2 more bytes]");
    }

    SECTION("Zero capacity keeps nothing") {
        BoundedBuffer buffer(0);
        buffer.Append("x");
        REQUIRE(buffer.Data().empty());
        REQUIRE(buffer.DroppedBytes() == 1);
    }
}

TEST_CASE("BoundedBuffer - UTF-8 boundaries", "[output][buffer]") {
    // "é" is two bytes; a cap landing inside it keeps the whole code point out
    BoundedBuffer buffer(4);
    buffer.Append("abc\xC3\xA9");

    REQUIRE(buffer.Data() == "abc");
    REQUIRE(buffer.DroppedBytes() == 2);
}

TEST_CASE("BoundedBuffer - Invalid UTF-8 in rendered output", "[output][buffer]") {
    SECTION("Stray bytes become U+FFFD") {
        BoundedBuffer buffer(64);
        buffer.Append("ok\xFF!");
        REQUIRE(buffer.Data() == "ok\xFF!");
        REQUIRE(buffer.Render() == "ok\xEF\xBF\xBD!");
    }

    SECTION("A sequence cut short by a killed worker") {
        BoundedBuffer buffer(64);
        buffer.Append("caf\xC3");
        REQUIRE(buffer.Render() == "caf\xEF\xBF\xBD");
    }

    SECTION("Valid multi-byte text is untouched") {
        BoundedBuffer buffer(64);
        buffer.Append("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x93\x8A");
        REQUIRE(buffer.Render() == buffer.Data());
    }

    SECTION("Overlong encodings and surrogates are rejected") {
        REQUIRE(ReplaceInvalidUtf8("\xC0\xAF") == "\xEF\xBF\xBD\xEF\xBF\xBD");
        REQUIRE(ReplaceInvalidUtf8("\xED\xA0\x80") ==
                "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
    }
}
