#include <catch2/catch_test_macros.hpp>

#include "archive/archive_format.hpp"

#include <array>
#include <cstring>

using namespace rscpack::archive;
using rscpack::core::ErrorKind;

TEST_CASE("Footer layout is bit-exact", "[archive][footer]") {
    Footer f;
    f.headerLength = 0x00000102;
    f.archiveDataLength = 0x00A0B0C0;

    const auto bytes = encode_footer(f);
    REQUIRE(bytes.size() == 24);

    REQUIRE(bytes[0] == 0x02);
    REQUIRE(bytes[1] == 0x01);
    REQUIRE(bytes[2] == 0x00);
    REQUIRE(bytes[3] == 0x00);
    REQUIRE(bytes[4] == 0xC0);
    REQUIRE(bytes[5] == 0xB0);
    REQUIRE(bytes[6] == 0xA0);
    REQUIRE(bytes[7] == 0x00);
    REQUIRE(std::memcmp(bytes.data() + 8, "RSCARCHIVE_V1___", 16) == 0);
}

TEST_CASE("decode_footer recovers the encoded lengths", "[archive][footer]") {
    Footer f;
    f.headerLength = 77;
    f.archiveDataLength = 5197;

    const auto bytes = encode_footer(f);
    Footer decoded;
    REQUIRE(decode_footer(bytes, &decoded));
    REQUIRE(decoded.headerLength == 77);
    REQUIRE(decoded.archiveDataLength == 5197);
}

TEST_CASE("decode_footer detects a tampered marker", "[archive][footer]") {
    Footer f;
    f.headerLength = 10;
    f.archiveDataLength = 20;
    const auto original = encode_footer(f);

    for (std::size_t i = 8; i < FOOTER_SIZE; ++i) {
        auto bytes = original;
        bytes[i] ^= 0x01;

        Footer out;
        const auto st = decode_footer(bytes, &out);
        REQUIRE_FALSE(st);
        REQUIRE(st.kind == ErrorKind::CorruptArchive);
    }
}

TEST_CASE("decode_footer rejects inconsistent input", "[archive][footer]") {
    SECTION("wrong size") {
        const std::array<std::uint8_t, 23> shortBytes{};
        REQUIRE(decode_footer(shortBytes, nullptr).kind == ErrorKind::CorruptArchive);
    }

    SECTION("header longer than archive data") {
        Footer f;
        f.headerLength = 30;
        f.archiveDataLength = 20;
        REQUIRE(decode_footer(encode_footer(f), nullptr).kind == ErrorKind::CorruptArchive);
    }

    SECTION("all zeroes") {
        const std::array<std::uint8_t, FOOTER_SIZE> zeros{};
        REQUIRE(decode_footer(zeros, nullptr).kind == ErrorKind::CorruptArchive);
    }
}

TEST_CASE("locate_archive", "[archive][footer]") {
    Footer f;
    f.headerLength = 40;
    f.archiveDataLength = 1000;

    SECTION("start is file size minus archive and footer") {
        std::uint64_t start = 0;
        REQUIRE(locate_archive(4096, f, &start));
        REQUIRE(start == 4096 - 1000 - 24);
    }

    SECTION("archive flush with the start of the file") {
        std::uint64_t start = 99;
        REQUIRE(locate_archive(1024, f, &start));
        REQUIRE(start == 0);
    }

    SECTION("declared length larger than the file") {
        std::uint64_t start = 0;
        const auto st = locate_archive(1023, f, &start);
        REQUIRE(st.kind == ErrorKind::CorruptArchive);
    }
}
