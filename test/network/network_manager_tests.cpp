// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license
// NetworkManager tests: two nodes over the simulated transport, synced
// end to end through their chain managers and dispatchers

#include "network/banman.hpp"
#include "network/network_manager.hpp"
#include "network/simulated_transport.hpp"
#include "test_helpers.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace stakenode;
using namespace stakenode::network;
using test::BuildChain;
using test::TestBlock;

namespace {

constexpr uint16_t kPortA = 9811;
constexpr uint16_t kPortB = 9812;

std::shared_ptr<PeerConfig> MakePeerConfig(const chain::ChainParams &params,
                                           uint16_t port) {
    auto config = std::make_shared<PeerConfig>();
    auto identity = crypto::NodeIdentity::Generate(0);
    REQUIRE(identity);
    config->identity = *identity;
    config->version = {params.GetChainName(), params.GetDistributedDbVersion(), 1};
    config->chain_id = params.GetChainId();
    config->listen_port = port;
    return config;
}

// A full node minus the real sockets and the external engine
struct Node {
    Node(boost::asio::io_context &io, std::shared_ptr<SimulatedTransport> transport,
         NetworkManager::Config net_config,
         std::shared_ptr<storage::MemoryStore> existing = nullptr)
        : params(chain::ChainParams::CreateSandbox()),
          store(existing ? std::move(existing)
                         : std::make_shared<storage::MemoryStore>()),
          storage(*store, params->GetChainId()),
          peer_config(MakePeerConfig(*params, net_config.listen_port)),
          engine(
              []() -> std::unique_ptr<validation::ValidationEngine> {
                  return std::make_unique<validation::SandboxEngine>();
              },
              validation::EngineHandleConfig{}),
          net(net_config, peer_config, storage, banman, std::move(transport), &io),
          dispatcher(storage, engine, validation::DispatcherConfig{1, 0},
                     [this](const validation::ApplyOutcome &outcome) {
                         net.post_apply_outcome(outcome);
                     }),
          manager(storage, dispatcher, net, sync::ChainManagerConfig{}) {
        REQUIRE(storage.Initialize(*params));
        REQUIRE(manager.Start());
        net.attach_chain_manager(&manager);
        REQUIRE(net.start());
    }

    PeerPtr OnlySession() {
        auto sessions = net.peer_manager().get_all_peers();
        REQUIRE(sessions.size() == 1);
        return sessions[0];
    }

    std::unique_ptr<chain::ChainParams> params;
    std::shared_ptr<storage::MemoryStore> store;
    storage::ChainStorage storage;
    BanMan banman;
    std::shared_ptr<PeerConfig> peer_config;
    validation::EngineHandle engine;
    NetworkManager net;
    validation::ValidationDispatcher dispatcher;
    sync::ChainManager manager;
};

NetworkManager::Config NetConfig(uint16_t port) {
    NetworkManager::Config config;
    config.listen_port = port;
    config.io_threads = 0;
    return config;
}

struct TwoNodeFixture {
    TwoNodeFixture() : transport(std::make_shared<SimulatedTransport>()) {}

    ~TwoNodeFixture() {
        for (auto *node : {a.get(), b.get()}) {
            if (node) {
                node->net.stop();
            }
        }
        Pump();
        for (auto *node : {a.get(), b.get()}) {
            if (node) {
                node->dispatcher.Shutdown();
            }
        }
    }

    void StartNodes(NetworkManager::Config config_a = NetConfig(kPortA),
                    std::shared_ptr<storage::MemoryStore> store_a = nullptr) {
        a = std::make_unique<Node>(io, transport, config_a, std::move(store_a));
        b = std::make_unique<Node>(io, transport, NetConfig(kPortB));
        Pump();
    }

    // Run handlers, deliver traffic and let dispatchers finish until quiet
    void Pump() {
        for (int round = 0; round < 500; ++round) {
            io.restart();
            const size_t ran = io.poll();
            const size_t delivered = transport->advance_time(0);
            for (auto *node : {a.get(), b.get()}) {
                if (node) {
                    node->dispatcher.WaitForIdle();
                }
            }
            if (ran == 0 && delivered == 0) {
                return;
            }
        }
    }

    boost::asio::io_context io;
    std::shared_ptr<SimulatedTransport> transport;
    std::unique_ptr<Node> a;
    std::unique_ptr<Node> b;
};

// Store with `blocks` applied on top of the sandbox genesis
std::shared_ptr<storage::MemoryStore> SeededStore(int count,
                                                  std::vector<TestBlock> &blocks) {
    auto store = std::make_shared<storage::MemoryStore>();
    test::ChainFixture seed(store);
    blocks = BuildChain(seed.Genesis(), count, 2);
    seed.ApplyLocal(blocks);
    REQUIRE(seed.storage.GetChainState()->head_level == count);
    return store;
}

} // namespace

TEST_CASE("NetworkManager - dial and handshake", "[network][network_manager]") {
    TwoNodeFixture fx;
    fx.StartNodes();
    auto &a = *fx.a;
    auto &b = *fx.b;

    CHECK_FALSE(b.net.connect_to("no-port"));
    CHECK_FALSE(b.net.connect_to("127.0.0.1:0"));
    REQUIRE(b.net.connect_to("127.0.0.1:9811"));
    fx.Pump();

    CHECK(a.net.peer_manager().get_established_peers().size() == 1);
    CHECK(b.net.peer_manager().get_established_peers().size() == 1);
    CHECK(a.net.peer_manager().inbound_count() == 1);
    CHECK(b.net.peer_manager().outbound_count() == 1);
    CHECK(b.OnlySession()->identity() == a.peer_config->identity.PeerId());

    // Both chain managers saw the session and its genesis branch
    CHECK(a.manager.PeerCount() == 1);
    CHECK(b.manager.PeerCount() == 1);
    CHECK(b.manager.IsPeerSynced(b.OnlySession()->id()));
    CHECK(b.OnlySession()->state() == PeerState::SYNCED);

    SECTION("an address already connected is not dialled twice") {
        CHECK_FALSE(b.net.connect_to("127.0.0.1:9811"));
    }

    SECTION("stopping closes our sessions") {
        b.net.stop();
        fx.Pump();
        CHECK_FALSE(b.net.is_running());
        CHECK(b.net.peer_manager().peer_count() == 0);
        CHECK(b.manager.PeerCount() == 0);
        CHECK_FALSE(b.net.connect_to("127.0.0.1:9811"));
    }
}

TEST_CASE("NetworkManager - a fresh node syncs from a peer", "[network][network_manager][sync]") {
    TwoNodeFixture fx;
    std::vector<TestBlock> blocks;
    fx.StartNodes(NetConfig(kPortA), SeededStore(6, blocks));
    auto &a = *fx.a;
    auto &b = *fx.b;
    REQUIRE(a.manager.Head().head_level == 6);
    REQUIRE(b.manager.Head().head_level == 0);

    REQUIRE(b.net.connect_to("127.0.0.1:9811"));
    fx.Pump();

    CHECK(b.manager.Head().head_level == 6);
    CHECK(b.manager.Head().head_hash == blocks.back().hash);
    for (const auto &block : blocks) {
        CHECK(b.storage.IsApplied(block.hash));
        CHECK(b.storage.GetContext(block.hash) == a.storage.GetContext(block.hash));
    }
    CHECK(b.manager.PendingCount() == 0);
    CHECK(b.dispatcher.applied_count() == 6);
    CHECK(b.OnlySession()->state() == PeerState::SYNCED);

    SECTION("new blocks on the serving node reach the follower") {
        auto more = BuildChain(blocks.back().header, 2, 2);
        for (const auto &block : more) {
            REQUIRE(a.storage.StoreHeader(block.header));
            for (size_t pass = 0; pass < block.operations.size(); ++pass) {
                REQUIRE(a.storage.StoreOperations(block.hash,
                                                  static_cast<uint8_t>(pass),
                                                  block.operations[pass]));
            }
            validation::ApplyJob job;
            job.header = block.header;
            job.operations = block.operations;
            REQUIRE(a.dispatcher.Enqueue(std::move(job)));
            fx.Pump();
        }

        // The head advance on A is broadcast and B fetches what it lacks
        CHECK(a.manager.Head().head_level == 8);
        CHECK(b.manager.Head().head_level == 8);
        CHECK(b.manager.Head().head_hash == more.back().hash);
    }
}

TEST_CASE("NetworkManager - bans through the peer channel", "[network][network_manager][ban]") {
    TwoNodeFixture fx;
    fx.StartNodes();
    auto &a = *fx.a;
    auto &b = *fx.b;

    REQUIRE(b.net.connect_to("127.0.0.1:9811"));
    fx.Pump();
    const auto session = a.OnlySession();
    const std::string identity = b.peer_config->identity.PeerId();
    REQUIRE(session->identity() == identity);

    SECTION("plain disconnect") {
        a.net.DisconnectPeer(session->id(), "test", false);
        fx.Pump();
        CHECK(session->disconnect_reason() == DisconnectReason::PROTOCOL_VIOLATION);
        CHECK_FALSE(a.banman.IsBanned(identity));
        CHECK(a.net.peer_manager().peer_count() == 0);
        CHECK(b.net.peer_manager().peer_count() == 0);
    }

    SECTION("ban refuses the identity on reconnect") {
        a.net.DisconnectPeer(session->id(), "invalid-block", true);
        fx.Pump();
        CHECK(session->state() == PeerState::BANNED);
        CHECK(a.banman.IsBanned(identity));
        CHECK(a.net.peer_manager().peer_count() == 0);
        CHECK(b.net.peer_manager().peer_count() == 0);

        REQUIRE(b.net.connect_to("127.0.0.1:9811"));
        fx.Pump();
        CHECK(a.net.peer_manager().peer_count() == 0);
        CHECK(b.net.peer_manager().peer_count() == 0);
        CHECK(a.manager.PeerCount() == 0);
    }

    SECTION("unknown peers are ignored") {
        a.net.DisconnectPeer(9999, "test", true);
        fx.Pump();
        CHECK(a.net.peer_manager().peer_count() == 1);
    }
}

TEST_CASE("NetworkManager - inbound flood is dropped before the handshake", "[network][network_manager]") {
    TwoNodeFixture fx;
    auto config = NetConfig(kPortA);
    config.peers.low_water = 1;
    config.peers.high_water = 1;
    fx.StartNodes(config);
    auto &a = *fx.a;

    std::vector<TransportConnectionPtr> raw;
    for (int i = 0; i < 3; ++i) {
        raw.push_back(fx.transport->connect("127.0.0.1", kPortA, nullptr));
        REQUIRE(raw.back());
    }
    fx.Pump();

    // Two sessions sit in the handshake; the third never got one
    CHECK(a.net.peer_manager().peer_count() == 2);
    CHECK(raw[0]->is_open());
    CHECK(raw[1]->is_open());
    CHECK_FALSE(raw[2]->is_open());
}

TEST_CASE("NetworkManager - replay recording", "[network][network_manager][replay]") {
    test::TempDir dir("netreplay");
    const auto path = dir.path() / "replay.jsonl";
    TwoNodeFixture fx;
    auto config = NetConfig(kPortA);
    config.replay_path = path;
    fx.StartNodes(config);
    auto &a = *fx.a;

    CHECK(a.net.replay_log().IsOpen());
    REQUIRE(fx.b->net.connect_to("127.0.0.1:9811"));
    fx.Pump();
    CHECK(a.net.replay_log().RecordedCount() >= 4);

    a.net.stop();
    fx.Pump();
    CHECK_FALSE(a.net.replay_log().IsOpen());

    ReplayReader reader;
    REQUIRE(reader.Open(path));
    auto first = reader.Next();
    REQUIRE(first);
    CHECK(first->kind == "connection");
    // Identity is not known until the connection message is parsed
    CHECK(first->identity.empty());
    auto second = reader.Next();
    REQUIRE(second);
    CHECK(second->kind == "metadata");
    CHECK(second->identity == fx.b->peer_config->identity.PeerId());
}
