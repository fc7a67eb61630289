// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license
// Unit tests for BanMan: identity cool-downs, expiry and persistence

#include "network/banman.hpp"
#include "test_helpers.hpp"
#include "util/time.hpp"
#include <catch2/catch_test_macros.hpp>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace stakenode;
using namespace stakenode::network;
using json = nlohmann::json;

namespace {

const std::string kAlice = "a1b2c3d4e5f60718293a4b5c6d7e8f90";
const std::string kBob = "0f1e2d3c4b5a69788796a5b4c3d2e1f0";

// Restores real time when a test leaves
struct MockTimeGuard {
    explicit MockTimeGuard(int64_t t) { util::SetMockTime(t); }
    ~MockTimeGuard() { util::SetMockTime(0); }
};

} // namespace

TEST_CASE("BanMan - basic operations", "[network][banman][unit]") {
    BanMan banman;

    SECTION("ban and check") {
        REQUIRE_FALSE(banman.IsBanned(kAlice));
        banman.Ban(kAlice, 3600, "invalid block");
        REQUIRE(banman.IsBanned(kAlice));
        REQUIRE_FALSE(banman.IsBanned(kBob));
    }

    SECTION("unban") {
        banman.Ban(kAlice, 3600);
        banman.Unban(kAlice);
        REQUIRE_FALSE(banman.IsBanned(kAlice));
        // Unknown identity is a no-op
        banman.Unban(kBob);
    }

    SECTION("list and clear") {
        banman.Ban(kAlice, 3600, "r1");
        banman.Ban(kBob, 0, "r2");

        auto banned = banman.GetBanned();
        REQUIRE(banned.size() == 2);
        CHECK(banned[kAlice].reason == "r1");
        CHECK(banned[kAlice].ban_until > banned[kAlice].create_time);
        CHECK(banned[kBob].ban_until == 0);

        banman.ClearBanned();
        CHECK(banman.GetBanned().empty());
    }

    SECTION("re-ban replaces the entry") {
        banman.Ban(kAlice, 60, "first");
        banman.Ban(kAlice, 0, "second");
        auto banned = banman.GetBanned();
        REQUIRE(banned.size() == 1);
        CHECK(banned[kAlice].reason == "second");
        CHECK(banned[kAlice].ban_until == 0);
    }
}

TEST_CASE("BanMan - cool-down expiry", "[network][banman][unit]") {
    MockTimeGuard time(1700000000);
    BanMan banman;

    banman.Ban(kAlice, 100, "misbehaving");
    banman.Ban(kBob, 0, "permanent");

    util::SetMockTime(1700000099);
    CHECK(banman.IsBanned(kAlice));

    util::SetMockTime(1700000100);
    CHECK_FALSE(banman.IsBanned(kAlice));
    // Still listed until swept
    CHECK(banman.GetBanned().count(kAlice) == 1);

    banman.SweepBanned();
    CHECK(banman.GetBanned().count(kAlice) == 0);

    util::SetMockTime(1700000000 + 10 * 365 * 86400);
    CHECK(banman.IsBanned(kBob));
}

TEST_CASE("BanMan - persistence", "[network][banman][unit]") {
    test::TempDir dir("banman");

    SECTION("bans survive a restart") {
        {
            BanMan banman(dir.path());
            banman.Ban(kAlice, 3600, "invalid block");
            banman.Ban(kBob, 0, "permanent");
        }
        REQUIRE(std::filesystem::exists(dir.path() / "banlist.json"));

        BanMan reloaded(dir.path());
        REQUIRE(reloaded.Load());
        CHECK(reloaded.IsBanned(kAlice));
        CHECK(reloaded.IsBanned(kBob));
        CHECK(reloaded.GetBanned()[kAlice].reason == "invalid block");
    }

    SECTION("file format") {
        {
            BanMan banman(dir.path());
            banman.Ban(kAlice, 3600, "r");
        }
        std::ifstream file(dir.path() / "banlist.json");
        json j;
        file >> j;
        REQUIRE(j.contains(kAlice));
        CHECK(j[kAlice]["version"] == BanEntry::CURRENT_VERSION);
        CHECK(j[kAlice]["reason"] == "r");
        CHECK(j[kAlice]["ban_until"].get<int64_t>() >
              j[kAlice]["create_time"].get<int64_t>());
        CHECK_FALSE(std::filesystem::exists(dir.path() / "banlist.json.tmp"));
    }

    SECTION("expired entries are dropped on load") {
        {
            MockTimeGuard time(1700000000);
            BanMan banman(dir.path());
            banman.Ban(kAlice, 10, "short");
            banman.Ban(kBob, 3600, "long");
        }
        MockTimeGuard later(1700000000 + 60);
        BanMan reloaded(dir.path());
        REQUIRE(reloaded.Load());
        CHECK(reloaded.GetBanned().count(kAlice) == 0);
        CHECK(reloaded.IsBanned(kBob));
    }

    SECTION("missing file loads empty") {
        BanMan banman(dir.path());
        REQUIRE(banman.Load());
        CHECK(banman.GetBanned().empty());
    }

    SECTION("corrupt file fails to load") {
        {
            std::ofstream out(dir.path() / "banlist.json");
            out << "{ not json";
        }
        BanMan banman(dir.path(), false);
        CHECK_FALSE(banman.Load());
    }

    SECTION("auto-save off writes only on Save()") {
        BanMan banman(dir.path(), false);
        banman.Ban(kAlice, 3600);
        CHECK_FALSE(std::filesystem::exists(dir.path() / "banlist.json"));
        REQUIRE(banman.Save());
        CHECK(std::filesystem::exists(dir.path() / "banlist.json"));
    }
}
