// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license
// Wire codec tests: handshake messages, peer messages and framing

#include "network/message.hpp"
#include "network/protocol.hpp"
#include "test_helpers.hpp"
#include "util/serialize.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace stakenode;
using namespace stakenode::message;

namespace {

template <typename T>
T DecodeAs(const std::vector<uint8_t> &payload) {
    PeerMessage out;
    REQUIRE(DecodeMessage(payload, out) == DecodeStatus::OK);
    REQUIRE(std::holds_alternative<T>(out));
    return std::get<T>(out);
}

} // namespace

TEST_CASE("ConnectionMessage codec", "[network][message]") {
    ConnectionMessage msg;
    msg.port = 29732;
    msg.public_key.fill(0x11);
    msg.proof_of_work_stamp.fill(0x22);
    msg.message_nonce.fill(0x33);
    msg.versions.push_back({"STAKENODE_SANDBOX", 0, 1});
    msg.versions.push_back({"STAKENODE_SANDBOX", 0, 0});

    auto bytes = msg.Serialize();

    ConnectionMessage decoded;
    REQUIRE(decoded.Deserialize(bytes));
    CHECK(decoded.port == 29732);
    CHECK(decoded.public_key == msg.public_key);
    CHECK(decoded.proof_of_work_stamp == msg.proof_of_work_stamp);
    CHECK(decoded.message_nonce == msg.message_nonce);
    CHECK(decoded.versions == msg.versions);

    SECTION("truncated") {
        bytes.pop_back();
        CHECK_FALSE(decoded.Deserialize(bytes));
    }

    SECTION("trailing bytes") {
        bytes.push_back(0);
        CHECK_FALSE(decoded.Deserialize(bytes));
    }

    SECTION("too many versions") {
        msg.versions.assign(protocol::MAX_SUPPORTED_VERSIONS + 1,
                            NetworkVersion{"X", 0, 1});
        CHECK_FALSE(decoded.Deserialize(msg.Serialize()));
    }
}

TEST_CASE("MetadataMessage and AckMessage codec", "[network][message]") {
    MetadataMessage meta;
    meta.chain_id = 0xDEADBEEF;
    meta.private_node = true;

    MetadataMessage meta_out;
    REQUIRE(meta_out.Deserialize(meta.Serialize()));
    CHECK(meta_out.chain_id == 0xDEADBEEF);
    CHECK(meta_out.private_node);
    CHECK_FALSE(meta_out.disable_mempool);

    AckMessage nack;
    nack.ack = false;
    nack.alternative_peers = {"10.0.0.1:9732", "[::1]:9732"};

    AckMessage nack_out;
    REQUIRE(nack_out.Deserialize(nack.Serialize()));
    CHECK_FALSE(nack_out.ack);
    CHECK(nack_out.alternative_peers == nack.alternative_peers);

    AckMessage ack_out;
    REQUIRE(ack_out.Deserialize(AckMessage{}.Serialize()));
    CHECK(ack_out.ack);
    CHECK(ack_out.alternative_peers.empty());
}

TEST_CASE("Peer message codec", "[network][message]") {
    auto params = chain::ChainParams::CreateSandbox();
    auto blocks = test::BuildChain(params->GenesisBlock(), 3, 2);

    SECTION("current branch") {
        CurrentBranchMessage msg;
        msg.chain_id = params->GetChainId();
        msg.branch = test::MakeBranch(params->GenesisBlock(), blocks, 2);

        auto payload = EncodeMessage(msg);
        CHECK(MessageTag(msg) == protocol::tags::CURRENT_BRANCH);
        auto decoded = DecodeAs<CurrentBranchMessage>(payload);
        CHECK(decoded.chain_id == msg.chain_id);
        CHECK(decoded.branch == msg.branch);
        CHECK(decoded.branch.head.GetHash() == blocks[2].hash);
    }

    SECTION("block header keeps its hash") {
        BlockHeaderMessage msg{blocks[1].header};
        auto decoded = DecodeAs<BlockHeaderMessage>(EncodeMessage(msg));
        CHECK(decoded.header.GetHash() == blocks[1].hash);
    }

    SECTION("operations keep their list hash") {
        OperationsForBlocksMessage msg;
        msg.key = {blocks[0].hash, 1};
        msg.operations = blocks[0].operations[1];
        auto decoded = DecodeAs<OperationsForBlocksMessage>(EncodeMessage(msg));
        CHECK(decoded.key == msg.key);
        CHECK(chain::ComputeOperationsListHash(decoded.operations) ==
              blocks[0].header.operations_hashes[1]);
    }

    SECTION("request limits") {
        GetBlockHeadersMessage msg;
        for (const auto &block : blocks) {
            msg.hashes.push_back(block.hash);
        }
        CHECK(DecodeAs<GetBlockHeadersMessage>(EncodeMessage(msg)).hashes ==
              msg.hashes);

        msg.hashes.assign(protocol::MAX_GET_BLOCK_HEADERS + 1, blocks[0].hash);
        PeerMessage out;
        CHECK(DecodeMessage(EncodeMessage(msg), out) == DecodeStatus::MALFORMED);
    }

    SECTION("advertise") {
        AdvertiseMessage msg{{"10.0.0.1:9732", "seed.example.org:9732"}};
        CHECK(DecodeAs<AdvertiseMessage>(EncodeMessage(msg)).addresses ==
              msg.addresses);
        CHECK(std::string(MessageName(PeerMessage{msg})) == "advertise");
    }
}

TEST_CASE("DecodeMessage classifies bad payloads", "[network][message]") {
    PeerMessage out;

    SECTION("empty payload is malformed") {
        CHECK(DecodeMessage({}, out) == DecodeStatus::MALFORMED);
    }

    SECTION("unknown tag") {
        util::Serializer s;
        s.write_uint16(0x7777);
        s.write_uint32(1);
        CHECK(DecodeMessage(s.data(), out) == DecodeStatus::UNKNOWN_TAG);
        CHECK(std::string(TagName(0x7777)) == "unknown");
    }

    SECTION("known tag with trailing garbage") {
        auto payload = EncodeMessage(GetCurrentBranchMessage{42});
        payload.push_back(0xFF);
        CHECK(DecodeMessage(payload, out) == DecodeStatus::MALFORMED);
    }

    SECTION("known tag with short body") {
        auto payload = EncodeMessage(GetCurrentBranchMessage{42});
        payload.resize(payload.size() - 1);
        CHECK(DecodeMessage(payload, out) == DecodeStatus::MALFORMED);
    }
}

TEST_CASE("FrameReader", "[network][message][framing]") {
    const std::vector<uint8_t> a{1, 2, 3};
    const std::vector<uint8_t> b(1000, 0x42);
    auto frame_a = FrameMessage(a);
    auto frame_b = FrameMessage(b);
    REQUIRE(frame_a.size() == protocol::FRAME_HEADER_SIZE + a.size());
    CHECK(frame_a[3] == 3);

    FrameReader reader;
    std::vector<uint8_t> payload;

    SECTION("byte at a time") {
        std::vector<uint8_t> stream(frame_a);
        stream.insert(stream.end(), frame_b.begin(), frame_b.end());
        std::vector<std::vector<uint8_t>> got;
        for (uint8_t byte : stream) {
            reader.Feed(std::span<const uint8_t>(&byte, 1));
            while (reader.Next(payload)) {
                got.push_back(payload);
            }
        }
        REQUIRE(got.size() == 2);
        CHECK(got[0] == a);
        CHECK(got[1] == b);
        CHECK(reader.Buffered() == 0);
    }

    SECTION("partial frame waits") {
        reader.Feed(std::span<const uint8_t>(frame_b.data(), 10));
        CHECK_FALSE(reader.Next(payload));
        CHECK_FALSE(reader.HasError());
        reader.Feed(std::span<const uint8_t>(frame_b.data() + 10,
                                             frame_b.size() - 10));
        REQUIRE(reader.Next(payload));
        CHECK(payload == b);
    }

    SECTION("empty frame") {
        reader.Feed(FrameMessage({}));
        REQUIRE(reader.Next(payload));
        CHECK(payload.empty());
    }

    SECTION("oversized length poisons the reader") {
        util::Serializer s;
        s.write_uint32(static_cast<uint32_t>(protocol::MAX_FRAME_SIZE + 1));
        reader.Feed(s.data());
        CHECK_FALSE(reader.Next(payload));
        CHECK(reader.HasError());

        // Valid data afterwards is not accepted
        reader.Feed(frame_a);
        CHECK_FALSE(reader.Next(payload));
    }
}
