// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license
// Unit tests for PeerManager: registry, connection band and address book

#include "network/peer_manager.hpp"
#include "util/time.hpp"
#include <catch2/catch_test_macros.hpp>
#include <algorithm>

using namespace stakenode;
using namespace stakenode::network;

namespace {

struct PeerManagerFixture {
    explicit PeerManagerFixture(PeerManager::Config config = {})
        : manager(config), config(std::make_shared<PeerConfig>()) {}

    // Unstarted session; the manager only looks at direction and address
    PeerPtr MakePeer(bool inbound, const std::string &address = "10.0.0.1",
                     uint16_t port = 9732) {
        PeerPtr peer = inbound
                           ? Peer::create_inbound(io, nullptr, config, nullptr)
                           : Peer::create_outbound(io, nullptr, config, nullptr,
                                                   address, port);
        peer->set_id(manager.allocate_peer_id());
        return peer;
    }

    PeerPtr AddPeer(bool inbound, const std::string &address = "10.0.0.1",
                    uint16_t port = 9732) {
        auto peer = MakePeer(inbound, address, port);
        REQUIRE(manager.add_peer(peer));
        return peer;
    }

    boost::asio::io_context io;
    PeerManager manager;
    std::shared_ptr<PeerConfig> config;
};

struct MockTimeGuard {
    explicit MockTimeGuard(int64_t t) { util::SetMockTime(t); }
    ~MockTimeGuard() { util::SetMockTime(0); }
};

} // namespace

TEST_CASE("PeerManager - registry", "[network][peer_manager][unit]") {
    PeerManagerFixture fx;

    auto a = fx.AddPeer(false, "10.0.0.1");
    auto b = fx.AddPeer(true);
    CHECK(a->id() != b->id());
    CHECK(fx.manager.peer_count() == 2);
    CHECK(fx.manager.inbound_count() == 1);
    CHECK(fx.manager.outbound_count() == 1);
    CHECK(fx.manager.get_peer(a->id()) == a);
    CHECK(fx.manager.get_all_peers().size() == 2);
    // Nobody has finished a handshake
    CHECK(fx.manager.get_established_peers().empty());

    SECTION("an id can only be registered once") {
        CHECK_FALSE(fx.manager.add_peer(a));
        CHECK_FALSE(fx.manager.add_peer(nullptr));
        CHECK(fx.manager.peer_count() == 2);
    }

    SECTION("removal") {
        fx.manager.remove_peer(a->id());
        CHECK_FALSE(fx.manager.get_peer(a->id()));
        CHECK(fx.manager.peer_count() == 1);
        // Unknown ids are ignored
        fx.manager.remove_peer(9999);
        CHECK(fx.manager.peer_count() == 1);
    }

    SECTION("disconnect_all closes every session") {
        fx.manager.disconnect_all();
        fx.io.run();
        CHECK(a->state() == PeerState::CLOSED);
        CHECK(b->state() == PeerState::CLOSED);
        CHECK(a->disconnect_reason() == DisconnectReason::SHUTDOWN);
    }
}

TEST_CASE("PeerManager - connection band hysteresis", "[network][peer_manager][unit]") {
    PeerManager::Config config;
    config.low_water = 2;
    config.high_water = 4;
    PeerManagerFixture fx(config);

    CHECK(fx.manager.outbound_slots_wanted() == 2);
    CHECK(fx.manager.accepting_inbound());

    std::vector<PeerPtr> peers;
    for (int i = 0; i < 3; ++i) {
        peers.push_back(fx.AddPeer(false, "10.0.0." + std::to_string(i + 1)));
    }
    CHECK(fx.manager.outbound_slots_wanted() == 0);
    CHECK(fx.manager.accepting_inbound());

    peers.push_back(fx.AddPeer(false, "10.0.0.4"));
    CHECK_FALSE(fx.manager.accepting_inbound());

    SECTION("inbound sessions are refused while saturated") {
        fx.manager.add_addresses({"10.1.0.1:9732", "10.1.0.2:9732"});
        auto inbound = fx.AddPeer(true);
        std::vector<std::string> alternatives;
        CHECK_FALSE(fx.manager.admit(inbound, alternatives));
        CHECK(alternatives.size() == 2);
    }

    SECTION("sessions beyond the high-water mark are refused") {
        auto outbound = fx.AddPeer(false, "10.0.0.5");
        std::vector<std::string> alternatives;
        CHECK_FALSE(fx.manager.admit(outbound, alternatives));
    }

    SECTION("inbound resumes only at the low-water mark") {
        fx.manager.remove_peer(peers[0]->id());
        CHECK_FALSE(fx.manager.accepting_inbound());
        fx.manager.remove_peer(peers[1]->id());
        CHECK(fx.manager.accepting_inbound());

        auto inbound = fx.AddPeer(true);
        std::vector<std::string> alternatives;
        CHECK(fx.manager.admit(inbound, alternatives));
        CHECK(alternatives.empty());
    }

    SECTION("a low-water mark above the high-water mark is clamped") {
        PeerManager::Config odd;
        odd.low_water = 8;
        odd.high_water = 3;
        PeerManager clamped(odd);
        CHECK(clamped.outbound_slots_wanted() == 3);
    }
}

TEST_CASE("PeerManager - address book", "[network][peer_manager][unit]") {
    MockTimeGuard time(1700000000);
    PeerManagerFixture fx;

    SECTION("only well-formed host:port entries are kept") {
        const std::string too_long(protocol::MAX_ADDRESS_LENGTH, 'a');
        size_t added = fx.manager.add_addresses(
            {"10.0.0.1:9732", "10.0.0.1:9732", "seed.example.org:9732",
             "[::1]:9733", "no-port", "host:0", too_long + ":1"});
        CHECK(added == 3);
        CHECK(fx.manager.address_count() == 3);
    }

    SECTION("the book is bounded") {
        PeerManager::Config config;
        config.max_addresses = 2;
        PeerManager small(config);
        CHECK(small.add_addresses({"10.0.0.1:1", "10.0.0.2:1", "10.0.0.3:1"}) == 2);
        CHECK(small.address_count() == 2);
    }

    SECTION("failed addresses wait out the retry interval and go last") {
        fx.manager.add_addresses({"10.0.0.1:9732", "10.0.0.2:9732", "10.0.0.3:9732"});

        auto first = fx.manager.pick_addresses_to_dial(8);
        CHECK(first.size() == 3);
        fx.manager.mark_dial_failed("10.0.0.1:9732");

        auto alternatives = fx.manager.alternative_peers(10);
        CHECK(std::find(alternatives.begin(), alternatives.end(),
                        "10.0.0.1:9732") == alternatives.end());

        util::SetMockTime(1700000000 + 10);
        auto soon = fx.manager.pick_addresses_to_dial(8);
        CHECK(soon.size() == 2);
        CHECK(std::find(soon.begin(), soon.end(), "10.0.0.1:9732") == soon.end());

        util::SetMockTime(1700000000 + 61);
        auto later = fx.manager.pick_addresses_to_dial(8);
        REQUIRE(later.size() == 3);
        CHECK(later.back() == "10.0.0.1:9732");

        fx.manager.mark_dial_succeeded("10.0.0.1:9732");
        CHECK(fx.manager.alternative_peers(10).size() == 3);
    }

    SECTION("connected addresses are not dialled") {
        fx.manager.add_addresses({"10.0.0.1:9732", "10.0.0.2:9732"});
        fx.AddPeer(false, "10.0.0.1", 9732);
        CHECK(fx.manager.is_connected_to("10.0.0.1:9732"));
        CHECK_FALSE(fx.manager.is_connected_to("10.0.0.2:9732"));

        auto picked = fx.manager.pick_addresses_to_dial(8);
        REQUIRE(picked.size() == 1);
        CHECK(picked[0] == "10.0.0.2:9732");
    }

    SECTION("pick respects the requested count") {
        fx.manager.add_addresses({"10.0.0.1:1", "10.0.0.2:1", "10.0.0.3:1"});
        CHECK(fx.manager.pick_addresses_to_dial(2).size() == 2);
        CHECK(fx.manager.pick_addresses_to_dial(0).empty());
    }
}
