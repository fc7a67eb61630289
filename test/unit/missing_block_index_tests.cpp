// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license
// Unit tests for the missing header/operations index and the invalid set

#include "sync/known_invalid.hpp"
#include "sync/missing_block_index.hpp"
#include <catch2/catch_test_macros.hpp>
#include <algorithm>

using namespace stakenode;
using namespace stakenode::sync;
using namespace std::chrono_literals;

namespace {

uint256 Hash(uint8_t tag) {
    uint256 h;
    h.data()[0] = tag;
    h.data()[31] = 0x5A;
    return h;
}

const auto kStart = std::chrono::steady_clock::time_point{} + 1000s;

} // namespace

TEST_CASE("MissingBlockIndex - membership and capacity", "[sync][missing][unit]") {
    MissingBlockIndex index(2);
    CHECK(index.Capacity() == 2);

    REQUIRE(index.Add(Hash(1), 10, 5));
    REQUIRE(index.Add(Hash(2), 11, 6));
    CHECK(index.Size() == 2);
    CHECK(index.Contains(Hash(1)));

    SECTION("full index refuses new hashes") {
        CHECK_FALSE(index.Add(Hash(3), 12, 7));
        CHECK_FALSE(index.Contains(Hash(3)));
        CHECK(index.Size() == 2);
    }

    SECTION("re-adding keeps the lowest floor") {
        REQUIRE(index.Add(Hash(1), 10, 2));
        REQUIRE(index.Add(Hash(1), 10, 9));
        REQUIRE(index.Get(Hash(1)));
        CHECK(index.Get(Hash(1))->lookback_floor == 2);
        CHECK(index.Get(Hash(1))->level_hint == 10);
        CHECK(index.Size() == 2);
    }

    SECTION("removal frees a slot") {
        index.Remove(Hash(1));
        CHECK_FALSE(index.Get(Hash(1)));
        CHECK(index.Add(Hash(3), 12, 7));
    }

    SECTION("advertisers only attach to tracked hashes") {
        index.AddAdvertiser(Hash(1), 7);
        index.AddAdvertiser(Hash(9), 7);
        CHECK(index.Get(Hash(1))->advertisers.count(7) == 1);
        CHECK_FALSE(index.Contains(Hash(9)));
    }
}

TEST_CASE("MissingBlockIndex - candidate selection", "[sync][missing][unit]") {
    MissingBlockIndex index(8);
    REQUIRE(index.Add(Hash(1), 1, 0));
    REQUIRE(index.Add(Hash(2), 2, 0));
    for (PeerId peer : {1, 2, 3}) {
        index.AddAdvertiser(Hash(1), peer);
        index.AddAdvertiser(Hash(2), peer);
    }

    SECTION("no candidate without advertisers") {
        REQUIRE(index.Add(Hash(3), 3, 0));
        CHECK_FALSE(index.PickCandidate(Hash(3), nullptr));
        CHECK_FALSE(index.PickCandidate(Hash(4), nullptr));
    }

    SECTION("least recently assigned peer goes first") {
        index.MarkInFlight(Hash(1), 1, kStart);
        auto next = index.PickCandidate(Hash(2), nullptr);
        REQUIRE(next);
        CHECK(*next != 1);
        index.MarkInFlight(Hash(2), *next, kStart);

        // Peer 1 is older than the peer just used
        index.Release(Hash(1), false);
        auto again = index.PickCandidate(Hash(1), nullptr);
        REQUIRE(again);
        CHECK(*again != 1);
        CHECK(*again != *next);
    }

    SECTION("an in-flight entry offers no candidate") {
        index.MarkInFlight(Hash(1), 2, kStart);
        CHECK_FALSE(index.PickCandidate(Hash(1), nullptr));
        CHECK(index.InFlightCount() == 1);
        CHECK(index.InFlightFor(2) == 1);
        CHECK(index.InFlightFor(1) == 0);
    }

    SECTION("tried peers and full peers are skipped") {
        index.MarkInFlight(Hash(1), 1, kStart);
        REQUIRE(index.Release(Hash(1), true) == PeerId{1});
        CHECK(index.Get(Hash(1))->tried.count(1) == 1);

        auto only_three = [](PeerId peer) { return peer == 3; };
        CHECK(index.PickCandidate(Hash(1), only_three) == PeerId{3});

        auto nobody = [](PeerId) { return false; };
        CHECK_FALSE(index.PickCandidate(Hash(1), nobody));

        index.ClearTried(1);
        CHECK(index.Get(Hash(1))->tried.empty());
    }

    SECTION("releasing an idle entry is a no-op") {
        CHECK_FALSE(index.Release(Hash(1), true));
        CHECK(index.Get(Hash(1))->tried.empty());
    }
}

TEST_CASE("MissingBlockIndex - peers leaving and timeouts", "[sync][missing][unit]") {
    MissingBlockIndex index(8);
    for (uint8_t tag = 1; tag <= 3; ++tag) {
        REQUIRE(index.Add(Hash(tag), tag, 0));
        index.AddAdvertiser(Hash(tag), 1);
        index.AddAdvertiser(Hash(tag), 2);
    }
    index.MarkInFlight(Hash(1), 1, kStart);
    index.MarkInFlight(Hash(2), 1, kStart + 10s);
    index.MarkInFlight(Hash(3), 2, kStart, 4);
    CHECK(index.Get(Hash(3))->in_flight_pass == 4);

    SECTION("disconnect releases only that peer's requests") {
        auto released = index.RemovePeer(1);
        std::sort(released.begin(), released.end());
        std::vector<uint256> expected{Hash(1), Hash(2)};
        std::sort(expected.begin(), expected.end());
        CHECK(released == expected);

        CHECK(index.InFlightFor(1) == 0);
        CHECK(index.InFlightFor(2) == 1);
        CHECK(index.Get(Hash(1))->advertisers.count(1) == 0);
        CHECK(index.PickCandidate(Hash(1), nullptr) == PeerId{2});

        auto idle = index.Unassigned();
        CHECK(idle.size() == 2);
    }

    SECTION("timeouts follow the request time") {
        CHECK(index.TimedOut(kStart + 29s, 30s).empty());

        auto expired = index.TimedOut(kStart + 30s, 30s);
        std::sort(expired.begin(), expired.end());
        std::vector<uint256> expected{Hash(1), Hash(3)};
        std::sort(expected.begin(), expected.end());
        CHECK(expired == expected);

        CHECK(index.TimedOut(kStart + 40s, 30s).size() == 3);
    }

    SECTION("hashes lists everything tracked") {
        CHECK(index.Hashes().size() == 3);
        CHECK(index.Unassigned().empty());
    }
}

TEST_CASE("KnownInvalidSet - cool-down", "[sync][invalid][unit]") {
    KnownInvalidSet invalid(60s);
    invalid.Insert(Hash(1), "empty-operation", kStart);
    invalid.Insert(Hash(2), "bad-header", kStart + 30s);

    CHECK(invalid.Contains(Hash(1)));
    CHECK(invalid.Reason(Hash(1)) == "empty-operation");
    CHECK(invalid.Reason(Hash(3)).empty());
    CHECK(invalid.Size() == 2);

    CHECK(invalid.Expire(kStart + 59s) == 0);
    CHECK(invalid.Expire(kStart + 60s) == 1);
    CHECK_FALSE(invalid.Contains(Hash(1)));
    CHECK(invalid.Contains(Hash(2)));

    // Re-inserting restarts the cool-down
    invalid.Insert(Hash(2), "bad-header", kStart + 80s);
    CHECK(invalid.Expire(kStart + 100s) == 0);
    CHECK(invalid.Expire(kStart + 140s) == 1);
    CHECK(invalid.Size() == 0);
}
