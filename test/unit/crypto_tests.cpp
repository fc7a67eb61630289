// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license
// Tests for hashing, identity proof-of-work, session ciphers and identity files

#include "crypto/hash.hpp"
#include "crypto/identity.hpp"
#include "crypto/pow.hpp"
#include "crypto/session.hpp"
#include "test_helpers.hpp"
#include "util/files.hpp"
#include "util/strencodings.hpp"
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <string>

using namespace stakenode;
using namespace stakenode::crypto;

namespace {

std::span<const uint8_t> Bytes(const std::string &s) {
    return {reinterpret_cast<const uint8_t *>(s.data()), s.size()};
}

} // namespace

TEST_CASE("SHA-256", "[crypto][hash]") {
    const std::string abc = "abc";
    CHECK(Sha256(Bytes(abc)).GetHex() ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    HashWriter hw;
    hw.Write(Bytes("a")).Write(Bytes("bc"));
    CHECK(hw.GetHash() == Sha256(Bytes(abc)));

    HashWriter labeled;
    labeled.Write(std::string_view("abc"));
    CHECK(labeled.GetHash() == Sha256(Bytes(abc)));
}

TEST_CASE("Random bytes", "[crypto][hash]") {
    std::array<uint8_t, 32> a{};
    std::array<uint8_t, 32> b{};
    REQUIRE(GetRandomBytes(a));
    REQUIRE(GetRandomBytes(b));
    CHECK(a != b);
}

TEST_CASE("Identity proof-of-work", "[crypto][pow]") {
    SECTION("leading zero bits") {
        uint256 h;
        CHECK(CountLeadingZeroBits(h) == 256);
        h.data()[1] = 0x10;
        CHECK(CountLeadingZeroBits(h) == 11);
        h.data()[0] = 0x80;
        CHECK(CountLeadingZeroBits(h) == 0);
    }

    PublicKey key{};
    key.fill(0x5A);

    SECTION("difficulty zero accepts any stamp") {
        PowStamp stamp{};
        CHECK(CheckProofOfWork(key, stamp, 0));
    }

    SECTION("generated stamp meets its difficulty") {
        auto stamp = GenerateProofOfWork(key, 8);
        REQUIRE(stamp);
        CHECK(CheckProofOfWork(key, *stamp, 8));
        CHECK(CountLeadingZeroBits(PowHash(key, *stamp)) >= 8);
    }

    SECTION("bounded search gives up") {
        CHECK_FALSE(GenerateProofOfWork(key, 256, 16));
    }
}

TEST_CASE("X25519 key agreement", "[crypto][session]") {
    auto alice = KeyPair::Generate();
    auto bob = KeyPair::Generate();
    REQUIRE(alice);
    REQUIRE(bob);
    CHECK(alice->public_key != bob->public_key);

    auto restored = KeyPair::FromSecret(alice->secret_key);
    REQUIRE(restored);
    CHECK(restored->public_key == alice->public_key);

    auto ab = DeriveSharedSecret(alice->secret_key, bob->public_key);
    auto ba = DeriveSharedSecret(bob->secret_key, alice->public_key);
    REQUIRE(ab);
    REQUIRE(ba);
    CHECK(*ab == *ba);

    // Low-order point
    PublicKey zero{};
    CHECK_FALSE(DeriveSharedSecret(alice->secret_key, zero));
}

TEST_CASE("Session cipher", "[crypto][session]") {
    auto alice = KeyPair::Generate();
    auto bob = KeyPair::Generate();
    REQUIRE(alice);
    REQUIRE(bob);

    const std::vector<uint8_t> hello_a{1, 2, 3, 4};
    const std::vector<uint8_t> hello_b{5, 6, 7, 8};

    auto a = SessionCipher::Establish(alice->secret_key, bob->public_key,
                                      hello_a, hello_b, true);
    auto b = SessionCipher::Establish(bob->secret_key, alice->public_key,
                                      hello_b, hello_a, false);
    REQUIRE(a);
    REQUIRE(b);

    const std::vector<uint8_t> plain{'p', 'i', 'n', 'g'};
    std::vector<uint8_t> frame;
    std::vector<uint8_t> out;

    SECTION("both directions") {
        REQUIRE(a->Encrypt(plain, frame));
        CHECK(frame.size() == plain.size() + SESSION_TAG_SIZE);
        REQUIRE(b->Decrypt(frame, out));
        CHECK(out == plain);

        REQUIRE(b->Encrypt(plain, frame));
        REQUIRE(a->Decrypt(frame, out));
        CHECK(out == plain);
    }

    SECTION("same plaintext encrypts differently each time") {
        std::vector<uint8_t> first;
        REQUIRE(a->Encrypt(plain, first));
        REQUIRE(a->Encrypt(plain, frame));
        CHECK(first != frame);
    }

    SECTION("tampered frame is rejected") {
        REQUIRE(a->Encrypt(plain, frame));
        frame[0] ^= 0x01;
        CHECK_FALSE(b->Decrypt(frame, out));
    }

    SECTION("replayed or reordered frames are rejected") {
        std::vector<uint8_t> first;
        REQUIRE(a->Encrypt(plain, first));
        REQUIRE(a->Encrypt(plain, frame));
        CHECK_FALSE(b->Decrypt(frame, out));
    }

    SECTION("a different transcript yields different keys") {
        const std::vector<uint8_t> forged{9, 9, 9, 9};
        auto c = SessionCipher::Establish(bob->secret_key, alice->public_key,
                                          hello_b, forged, false);
        REQUIRE(c);
        REQUIRE(a->Encrypt(plain, frame));
        CHECK_FALSE(c->Decrypt(frame, out));
    }

    SECTION("short frame") {
        CHECK_FALSE(b->Decrypt(std::vector<uint8_t>(SESSION_TAG_SIZE - 1, 0), out));
    }
}

TEST_CASE("Node identity files", "[crypto][identity]") {
    test::TempDir dir("identity");
    const auto path = dir.path() / "identity.json";

    auto identity = NodeIdentity::Generate(4);
    REQUIRE(identity);
    CHECK(identity->PeerId().size() == 64);
    CHECK(CheckProofOfWork(identity->keys.public_key, identity->stamp, 4));

    REQUIRE(identity->Save(path));

    SECTION("load round trip") {
        auto loaded = NodeIdentity::Load(path, 4);
        REQUIRE(loaded);
        CHECK(loaded->keys.public_key == identity->keys.public_key);
        CHECK(loaded->keys.secret_key == identity->keys.secret_key);
        CHECK(loaded->stamp == identity->stamp);
        CHECK(loaded->PeerId() == identity->PeerId());
    }

    SECTION("stamp below the required difficulty") {
        CHECK_FALSE(NodeIdentity::Load(path, 256));
    }

    SECTION("public key that does not match the secret") {
        std::string content;
        REQUIRE(util::read_file(path, content));
        auto j = nlohmann::json::parse(content);
        auto other = KeyPair::Generate();
        REQUIRE(other);
        j["public_key"] = util::HexStr(other->public_key);
        REQUIRE(util::atomic_write_file(path, j.dump()));
        CHECK_FALSE(NodeIdentity::Load(path, 0));
    }

    SECTION("malformed and missing files") {
        REQUIRE(util::atomic_write_file(path, "{\"public_key\": 1"));
        CHECK_FALSE(NodeIdentity::Load(path, 0));
        CHECK_FALSE(NodeIdentity::Load(dir.path() / "absent.json", 0));
    }
}
