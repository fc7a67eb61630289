// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license
// Tests for hex/number parsing, host:port splitting and the binary codec

#include "util/serialize.hpp"
#include "util/strencodings.hpp"
#include <catch2/catch_test_macros.hpp>
#include <limits>

using namespace stakenode;
using namespace stakenode::util;

TEST_CASE("HexStr and ParseHex", "[util][strencodings]") {
    const std::vector<uint8_t> bytes{0x00, 0x01, 0xab, 0xff};

    SECTION("lower-case encoding") {
        CHECK(HexStr(bytes) == "0001abff");
        CHECK(HexStr(std::vector<uint8_t>{}).empty());
    }

    SECTION("either case decodes") {
        auto parsed = ParseHex("0001ABff");
        REQUIRE(parsed);
        CHECK(*parsed == bytes);
    }

    SECTION("odd length and non-hex input are rejected") {
        CHECK_FALSE(ParseHex("abc"));
        CHECK_FALSE(ParseHex("zz"));
        CHECK_FALSE(ParseHex("0x12"));
    }

    SECTION("empty input is an empty buffer") {
        auto parsed = ParseHex("");
        REQUIRE(parsed);
        CHECK(parsed->empty());
    }
}

TEST_CASE("Strict integer parsing", "[util][strencodings]") {
    CHECK(ParseInt64("0") == 0);
    CHECK(ParseInt64("-42") == -42);
    CHECK(ParseInt64("9223372036854775807") ==
          std::numeric_limits<int64_t>::max());

    CHECK_FALSE(ParseInt64(""));
    CHECK_FALSE(ParseInt64("12a"));
    CHECK_FALSE(ParseInt64(" 12"));
    CHECK_FALSE(ParseInt64("9223372036854775808"));

    CHECK(ParseUInt64("18446744073709551615") ==
          std::numeric_limits<uint64_t>::max());
    CHECK_FALSE(ParseUInt64("-1"));
}

TEST_CASE("TrimString", "[util][strencodings]") {
    CHECK(TrimString("  seed = 1 \r\n") == "seed = 1");
    CHECK(TrimString("\t\t").empty());
    CHECK(TrimString("x") == "x");
}

TEST_CASE("SplitHostPort", "[util][strencodings]") {
    std::string host;
    uint16_t port = 1;

    SECTION("IPv4 with port") {
        REQUIRE(SplitHostPort("10.0.0.1:9732", host, port));
        CHECK(host == "10.0.0.1");
        CHECK(port == 9732);
    }

    SECTION("hostname without port") {
        REQUIRE(SplitHostPort("seed.example.org", host, port));
        CHECK(host == "seed.example.org");
        CHECK(port == 0);
    }

    SECTION("bracketed IPv6 with port") {
        REQUIRE(SplitHostPort("[::1]:29732", host, port));
        CHECK(host == "::1");
        CHECK(port == 29732);
    }

    SECTION("bare IPv6 has no port") {
        REQUIRE(SplitHostPort("fe80::1", host, port));
        CHECK(host == "fe80::1");
        CHECK(port == 0);
    }

    SECTION("invalid ports and empty hosts") {
        CHECK_FALSE(SplitHostPort("", host, port));
        CHECK_FALSE(SplitHostPort("host:0", host, port));
        CHECK_FALSE(SplitHostPort("host:65536", host, port));
        CHECK_FALSE(SplitHostPort("host:port", host, port));
        CHECK_FALSE(SplitHostPort(":9732", host, port));
    }
}

TEST_CASE("Serializer writes big-endian", "[util][serialize]") {
    Serializer s;
    s.write_uint16(0x0102);
    s.write_uint32(0x03040506);
    s.write_int32(-1);
    s.write_string("ab");

    const std::vector<uint8_t> expected{0x01, 0x02, 0x03, 0x04, 0x05, 0x06,
                                        0xff, 0xff, 0xff, 0xff, 0x00, 0x02,
                                        'a',  'b'};
    CHECK(s.data() == expected);

    Deserializer d(s.data());
    CHECK(d.read_uint16() == 0x0102);
    CHECK(d.read_uint32() == 0x03040506);
    CHECK(d.read_int32() == -1);
    CHECK(d.read_string(16) == "ab");
    CHECK(d.at_end());
    CHECK_FALSE(d.has_error());
}

TEST_CASE("Deserializer latches the first error", "[util][serialize]") {
    SECTION("short read") {
        const std::vector<uint8_t> data{0x01, 0x02};
        Deserializer d(data);
        CHECK(d.read_uint32() == 0);
        CHECK(d.has_error());
        // Later reads return zero values
        CHECK(d.read_uint8() == 0);
        CHECK(d.bytes_remaining() == 0);
        CHECK_FALSE(d.at_end());
    }

    SECTION("length above the limit") {
        Serializer s;
        s.write_sized_bytes(std::vector<uint8_t>(10, 0x55));
        Deserializer d(s.data());
        CHECK(d.read_sized_bytes(9).empty());
        CHECK(d.has_error());
    }

    SECTION("count that the input cannot hold") {
        Serializer s;
        s.write_uint32(1000);
        s.write_uint8(0);
        Deserializer d(s.data());
        CHECK(d.read_count(5000, 32) == 0);
        CHECK(d.has_error());
    }

    SECTION("count above the maximum") {
        Serializer s;
        s.write_uint32(3);
        s.write_bytes(std::vector<uint8_t>(3, 0));
        Deserializer d(s.data());
        CHECK(d.read_count(2) == 0);
        CHECK(d.has_error());
    }
}
