// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license
// Chain manager invariants under repeated, duplicated and hostile input

#include "test_helpers.hpp"
#include "util/time.hpp"
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <algorithm>

using namespace stakenode;
using namespace stakenode::test;
using sync::FetchKind;
using sync::MisbehaviorPenalty::PROTOCOL_VIOLATION;

namespace {

// Every applied block's predecessor was applied before it (or is local)
bool AppliedInAncestorOrder(const ChainFixture &fx,
                            const std::vector<TestBlock> &blocks,
                            int32_t base_level) {
    int32_t expected = base_level + 1;
    for (int32_t level : fx.applied_levels) {
        if (level != expected) {
            return false;
        }
        ++expected;
    }
    return expected == static_cast<int32_t>(blocks.size()) + 1;
}

} // namespace

TEST_CASE("ChainManager property - blocks apply ancestor first", "[chain][property]") {
    const int length = GENERATE(1, 2, 7, 33);

    ChainFixture fx;
    auto blocks = BuildChain(fx.Genesis(), length, 2);
    REQUIRE(fx.manager.Start());

    fx.Connect(1);
    fx.Advertise(1, MakeBranch(fx.Genesis(), blocks, blocks.size() - 1));
    fx.ServeAll(blocks, {1});

    CHECK(AppliedInAncestorOrder(fx, blocks, 0));
    CHECK(fx.manager.Head().head_level == length);
    CHECK(fx.dispatcher.applied_count() == static_cast<uint64_t>(length));
    for (const auto &block : blocks) {
        CHECK(fx.storage.IsApplied(block.hash));
        CHECK(fx.storage.IsCanonical(block.hash, block.header.level));
    }
}

TEST_CASE("ChainManager property - one request per missing item", "[chain][property]") {
    ChainFixture fx;
    auto blocks = BuildChain(fx.Genesis(), 12);
    REQUIRE(fx.manager.Start());

    const auto branch = MakeBranch(fx.Genesis(), blocks, 11);
    for (sync::PeerId peer = 1; peer <= 4; ++peer) {
        fx.Connect(peer);
        fx.Advertise(peer, branch);
    }

    for (const auto &block : blocks) {
        CHECK(fx.channel.CountFetches(FetchKind::HEADER, block.hash) <= 1);
        CHECK(fx.channel.CountFetches(FetchKind::OPERATIONS, block.hash) <= 1);
    }
    const size_t pending = fx.manager.PendingCount();

    SECTION("re-advertising changes nothing") {
        const size_t requests = fx.channel.fetch_history.size();
        for (sync::PeerId peer = 1; peer <= 4; ++peer) {
            fx.Advertise(peer, branch);
        }
        CHECK(fx.channel.fetch_history.size() == requests);
        CHECK(fx.manager.PendingCount() == pending);
    }

    SECTION("every block is applied exactly once") {
        fx.ServeAll(blocks, {1, 2, 3, 4});
        for (const auto &block : blocks) {
            CHECK(fx.channel.CountFetches(FetchKind::HEADER, block.hash) <= 1);
            CHECK(fx.channel.CountFetches(FetchKind::OPERATIONS, block.hash) == 1);
        }
        CHECK(fx.dispatcher.applied_count() == blocks.size());
        CHECK(AppliedInAncestorOrder(fx, blocks, 0));
        CHECK(fx.manager.PendingCount() == 0);
    }
}

TEST_CASE("ChainManager property - at most one peer holds a request", "[chain][property]") {
    ChainFixture fx;
    auto blocks = BuildChain(fx.Genesis(), 20);
    REQUIRE(fx.manager.Start());

    const auto branch = MakeBranch(fx.Genesis(), blocks, 19);
    for (sync::PeerId peer = 1; peer <= 3; ++peer) {
        fx.Connect(peer);
        fx.Advertise(peer, branch);
    }

    // Outstanding requests as seen by the channel match the indices
    std::set<std::pair<int, uint256>> outstanding;
    for (const auto &[peer, request] : fx.channel.fetches) {
        CHECK(outstanding.insert({static_cast<int>(request.kind),
                                  request.block_hash})
                  .second);
    }
    const size_t in_flight = fx.manager.MissingHeaders().InFlightCount() +
                             fx.manager.MissingOperations().InFlightCount();
    CHECK(in_flight == outstanding.size());
}

TEST_CASE("ChainManager property - a failed commit leaves the head untouched", "[chain][property]") {
    auto store = std::make_shared<storage::MemoryStore>();
    ChainFixture fx(store);
    auto blocks = BuildChain(fx.Genesis(), 3);
    fx.ApplyLocal({blocks.begin(), blocks.begin() + 2});

    // Level 3 is complete on disk; the next batch write (its commit) fails
    REQUIRE(fx.storage.StoreHeader(blocks[2].header));
    REQUIRE(fx.storage.StoreOperations(blocks[2].hash, 0, blocks[2].operations[0]));
    store->FailNextWrites(1);

    REQUIRE(fx.manager.Start());
    fx.Settle();

    CHECK(fx.manager.IsHalted());
    CHECK(fx.dispatcher.IsHalted());
    auto state = fx.storage.GetChainState();
    REQUIRE(state);
    CHECK(state->head_level == 2);
    CHECK(state->head_hash == blocks[1].hash);
    CHECK_FALSE(fx.storage.IsApplied(blocks[2].hash));
    CHECK_FALSE(fx.storage.GetContext(blocks[2].hash));
    CHECK_FALSE(fx.storage.GetCanonicalHash(3));
    CHECK(fx.applied_levels.empty());
}

TEST_CASE("ChainManager property - scores only go down", "[chain][property]") {
    ChainFixture fx;
    auto blocks = BuildChain(fx.Genesis(), 2);
    REQUIRE(fx.manager.Start());
    fx.Connect(1);
    fx.Connect(2);
    fx.Advertise(1, MakeBranch(fx.Genesis(), blocks, 1));

    int previous = 0;
    for (int round = 0; round < 8; ++round) {
        if (round % 2 == 0) {
            fx.manager.HandleEvent(sync::ProtocolViolation{1, "bad message"});
        } else {
            // Good data never raises a score
            fx.ServeAll(blocks, {1});
        }
        auto score = fx.manager.GetPeerScore(1);
        REQUIRE(score);
        CHECK(*score <= previous);
        previous = *score;
    }

    CHECK(previous == -4 * PROTOCOL_VIOLATION);
    CHECK(fx.manager.GetPeerScore(2) == 0);
}

TEST_CASE("ChainManager property - ban exactly at the threshold", "[chain][property]") {
    ChainFixture fx;
    REQUIRE(fx.manager.Start());
    fx.Connect(1);

    const int to_ban = -sync::DEFAULT_BAN_THRESHOLD / PROTOCOL_VIOLATION;
    for (int i = 0; i < to_ban - 1; ++i) {
        fx.manager.HandleEvent(sync::ProtocolViolation{1, "garbage"});
    }
    CHECK(fx.channel.disconnects.empty());

    fx.manager.HandleEvent(sync::ProtocolViolation{1, "garbage"});
    REQUIRE(fx.channel.disconnects.size() == 1);
    CHECK(fx.channel.disconnects[0].peer == 1);
    CHECK(fx.channel.disconnects[0].ban);
    CHECK(fx.manager.GetPeerScore(1) == sync::DEFAULT_BAN_THRESHOLD);

    // Further misbehavior before the session closes is not a second ban
    fx.manager.HandleEvent(sync::ProtocolViolation{1, "garbage"});
    CHECK(fx.channel.disconnects.size() == 1);
    CHECK(fx.manager.GetPeerScore(1) < sync::DEFAULT_BAN_THRESHOLD);

    fx.manager.HandleEvent(sync::PeerDisconnected{1});
    CHECK_FALSE(fx.manager.GetPeerScore(1));
    CHECK(fx.manager.PeerCount() == 0);
}

TEST_CASE("ChainManager property - disconnected peer's requests are reassigned", "[chain][property]") {
    ChainFixture fx;
    auto blocks = BuildChain(fx.Genesis(), 16);
    REQUIRE(fx.manager.Start());

    const auto branch = MakeBranch(fx.Genesis(), blocks, 15);
    fx.Connect(1);
    fx.Connect(2);
    fx.Advertise(1, branch);
    fx.Advertise(2, branch);

    // Peer 1 vanishes with requests outstanding
    REQUIRE(fx.manager.MissingHeaders().InFlightFor(1) +
                fx.manager.MissingOperations().InFlightFor(1) >
            0);
    fx.manager.HandleEvent(sync::PeerDisconnected{1});
    fx.Settle();

    CHECK(fx.manager.MissingHeaders().InFlightFor(1) == 0);
    CHECK(fx.manager.MissingOperations().InFlightFor(1) == 0);

    // Drop what was addressed to the dead session; peer 2 finishes the job
    auto queued = fx.channel.TakeFetches();
    queued.erase(std::remove_if(queued.begin(), queued.end(),
                                [](const auto &f) { return f.first == 1; }),
                 queued.end());
    fx.channel.fetches = queued;
    for (int round = 0; round < 20 && fx.manager.Head().head_level < 16; ++round) {
        fx.ServeAll(blocks, {2});
        fx.manager.ProcessTimers(util::GetSteadyTime());
    }

    CHECK(fx.manager.Head().head_level == 16);
    CHECK(AppliedInAncestorOrder(fx, blocks, 0));
}

TEST_CASE("ChainManager property - silent peers time out under a mock clock", "[chain][property]") {
    util::SetMockTime(1700000000);

    ChainFixture fx;
    auto blocks = BuildChain(fx.Genesis(), 2);
    REQUIRE(fx.manager.Start());

    const auto branch = MakeBranch(fx.Genesis(), blocks, 1);
    fx.Connect(1);
    fx.Connect(2);
    fx.Advertise(1, branch);
    fx.Advertise(2, branch);

    const size_t held_by_1 = fx.manager.MissingHeaders().InFlightFor(1) +
                             fx.manager.MissingOperations().InFlightFor(1);
    REQUIRE(held_by_1 > 0);

    // Just under the timeout: nothing moves
    util::SetMockTime(1700000000 + 29);
    fx.manager.ProcessTimers(util::GetSteadyTime());
    CHECK(fx.manager.MissingHeaders().InFlightFor(1) +
              fx.manager.MissingOperations().InFlightFor(1) ==
          held_by_1);

    util::SetMockTime(1700000000 + 31);
    fx.manager.ProcessTimers(util::GetSteadyTime());
    CHECK(fx.manager.MissingHeaders().InFlightFor(1) +
              fx.manager.MissingOperations().InFlightFor(1) ==
          0);
    CHECK(fx.manager.MissingHeaders().InFlightFor(2) +
              fx.manager.MissingOperations().InFlightFor(2) ==
          held_by_1);

    // Peer 1 is never asked for those again
    std::set<std::pair<int, uint256>> moved;
    for (const auto &[peer, request] : fx.channel.TakeFetches()) {
        if (peer == 2) {
            moved.insert({static_cast<int>(request.kind), request.block_hash});
        }
    }
    CHECK(moved.size() == held_by_1);

    util::SetMockTime(0);
}

TEST_CASE("ChainManager property - missing index never exceeds its cap", "[chain][property]") {
    sync::ChainManagerConfig config;
    config.max_missing_blocks = 3;
    ChainFixture fx(nullptr, config);
    auto blocks = BuildChain(fx.Genesis(), 40);
    REQUIRE(fx.manager.Start());

    fx.Connect(1);
    fx.Advertise(1, MakeBranch(fx.Genesis(), blocks, 39));
    CHECK(fx.manager.MissingHeaders().Size() <= 3);
    CHECK(fx.manager.MissingOperations().Size() <= 3);

    for (int round = 0; round < 200 && fx.manager.Head().head_level < 40; ++round) {
        fx.ServeAll(blocks, {1});
        fx.manager.ProcessTimers(util::GetSteadyTime());
        CHECK(fx.manager.MissingHeaders().Size() <= 3);
        CHECK(fx.manager.MissingOperations().Size() <= 3);
    }
    CHECK(fx.manager.Head().head_level == 40);
}
