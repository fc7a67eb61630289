// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license
// Tests for the key-value backends and the chain stores built on them

#include "crypto/hash.hpp"
#include "storage/chain_storage.hpp"
#include "storage/memory_store.hpp"
#include "storage/rocksdb_store.hpp"
#include "test_helpers.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace stakenode;
using namespace stakenode::storage;
using test::BuildChain;
using test::TestBlock;

namespace {

uint256 ContextOf(const TestBlock &block) {
    crypto::HashWriter hw;
    hw.Write(std::string_view("context/")).Write(block.hash);
    return hw.GetHash();
}

std::optional<CommitOutcome> Commit(ChainStorage &storage, const TestBlock &block,
                                    int32_t history_window = 0) {
    BlockCommit commit;
    commit.header = block.header;
    commit.operations = block.operations;
    commit.context_hash = ContextOf(block);
    commit.metadata.applied_time = block.header.timestamp;
    commit.metadata.operation_results.assign(block.operations.size(), "applied");
    commit.history_window = history_window;
    return storage.CommitApplication(commit);
}

void CommitAll(ChainStorage &storage, const std::vector<TestBlock> &blocks,
               int32_t history_window = 0) {
    for (const auto &block : blocks) {
        REQUIRE(Commit(storage, block, history_window));
    }
}

} // namespace

TEST_CASE("MemoryStore", "[storage][unit]") {
    MemoryStore store;
    REQUIRE(store.Put("a1", "x"));
    REQUIRE(store.Put("b1", "y"));
    REQUIRE(store.Put("a2", "z"));

    SECTION("prefix scan is ordered and bounded") {
        auto rows = store.PrefixScan("a");
        REQUIRE(rows.size() == 2);
        CHECK(rows[0].first == "a1");
        CHECK(rows[1].first == "a2");
        CHECK(store.PrefixScan("c").empty());
    }

    SECTION("batch mixes puts and deletes") {
        WriteBatch batch;
        batch.Put("c1", "w");
        batch.Delete("a1");
        REQUIRE(store.Write(batch));
        CHECK(store.Get("c1") == "w");
        CHECK_FALSE(store.Exists("a1"));
        CHECK(store.Size() == 3);
    }

    SECTION("a failed write applies nothing") {
        const size_t writes = store.WriteCount();
        store.FailNextWrites(2);

        WriteBatch batch;
        batch.Put("c1", "w");
        batch.Delete("a1");
        CHECK_FALSE(store.Write(batch));
        CHECK_FALSE(store.Put("d1", "v"));
        CHECK_FALSE(store.Exists("c1"));
        CHECK(store.Exists("a1"));
        CHECK(store.WriteCount() == writes);

        REQUIRE(store.Put("d1", "v"));
        CHECK(store.Get("d1") == "v");
    }
}

TEST_CASE("ChainStorage - initialization", "[storage][unit]") {
    auto params = chain::ChainParams::CreateSandbox();
    MemoryStore store;
    ChainStorage storage(store, params->GetChainId());

    CHECK_FALSE(storage.GetChainState());
    CHECK_FALSE(storage.GetCurrentBranch(8));

    REQUIRE(storage.Initialize(*params));
    auto state = storage.GetChainState();
    REQUIRE(state);
    CHECK(state->head_hash == params->GenesisHash());
    CHECK(state->head_level == 0);
    CHECK(state->checkpoint_level == 0);
    CHECK(storage.IsApplied(params->GenesisHash()));
    CHECK(storage.IsCanonical(params->GenesisHash(), 0));
    CHECK(storage.GetContext(params->GenesisHash()) == params->GenesisContext());
    CHECK(storage.GetBranchHistory(8).empty());

    SECTION("initializing again keeps the state") {
        REQUIRE(storage.Initialize(*params));
        CHECK(storage.GetChainState() == state);
    }

    SECTION("a store holding another genesis is refused") {
        auto other = chain::ChainParams::CreateTestNet();
        REQUIRE(other->GenesisHash() != params->GenesisHash());
        CHECK_FALSE(storage.Initialize(*other));
    }

    SECTION("genesis write failure") {
        MemoryStore failing;
        failing.FailNextWrites(1);
        ChainStorage fresh(failing, params->GetChainId());
        CHECK_FALSE(fresh.Initialize(*params));
        CHECK_FALSE(fresh.GetChainState());
    }
}

TEST_CASE("ChainStorage - headers and operations are written once", "[storage][unit]") {
    auto params = chain::ChainParams::CreateSandbox();
    MemoryStore store;
    ChainStorage storage(store, params->GetChainId());
    REQUIRE(storage.Initialize(*params));

    auto blocks = BuildChain(params->GenesisBlock(), 1, 2);
    const auto &block = blocks[0];

    REQUIRE(storage.StoreHeader(block.header));
    CHECK(storage.HasBlock(block.hash));
    CHECK_FALSE(storage.IsApplied(block.hash));
    REQUIRE(storage.GetHeader(block.hash));
    CHECK(storage.GetHeader(block.hash)->GetHash() == block.hash);

    REQUIRE(storage.StoreOperations(block.hash, 1, block.operations[1]));
    CHECK(storage.HasOperations(block.hash, 1));
    CHECK_FALSE(storage.HasOperations(block.hash, 0));
    CHECK(storage.GetOperations(block.hash, 1) == block.operations[1]);

    // Storing again is a no-op that does not touch the backend
    const size_t writes = store.WriteCount();
    REQUIRE(storage.StoreHeader(block.header));
    REQUIRE(storage.StoreOperations(block.hash, 1, block.operations[0]));
    CHECK(store.WriteCount() == writes);
    CHECK(storage.GetOperations(block.hash, 1) == block.operations[1]);

    SECTION("write failure is reported") {
        auto next = BuildChain(block.header, 1);
        store.FailNextWrites(1);
        CHECK_FALSE(storage.StoreHeader(next[0].header));
        CHECK_FALSE(storage.HasBlock(next[0].hash));
    }
}

TEST_CASE("ChainStorage - committing applications", "[storage][unit]") {
    auto params = chain::ChainParams::CreateSandbox();
    MemoryStore store;
    ChainStorage storage(store, params->GetChainId());
    REQUIRE(storage.Initialize(*params));

    auto blocks = BuildChain(params->GenesisBlock(), 5, 2);

    SECTION("each commit advances the head") {
        for (const auto &block : blocks) {
            auto outcome = Commit(storage, block);
            REQUIRE(outcome);
            CHECK(outcome->head_advanced);
            CHECK(outcome->state.head_hash == block.hash);
            CHECK(outcome->state.head_level == block.header.level);
            CHECK(storage.GetChainState() == outcome->state);
        }

        const auto &last = blocks.back();
        auto stored = storage.GetBlock(last.hash);
        REQUIRE(stored);
        CHECK(stored->metadata.applied);
        CHECK(stored->metadata.operation_results.size() == 2);
        CHECK(storage.GetContext(last.hash) == ContextOf(last));
        CHECK(storage.GetOperations(last.hash, 0) == last.operations[0]);
        for (const auto &block : blocks) {
            CHECK(storage.IsCanonical(block.hash, block.header.level));
        }

        auto branch = storage.GetCurrentBranch(8);
        REQUIRE(branch);
        CHECK(branch->head.GetHash() == last.hash);
    }

    SECTION("a failed batch leaves nothing behind") {
        CommitAll(storage, {blocks.begin(), blocks.begin() + 2});
        const auto before = storage.GetChainState();

        store.FailNextWrites(1);
        CHECK_FALSE(Commit(storage, blocks[2]));

        CHECK(storage.GetChainState() == before);
        CHECK_FALSE(storage.HasBlock(blocks[2].hash));
        CHECK_FALSE(storage.HasOperations(blocks[2].hash, 0));
        CHECK_FALSE(storage.GetContext(blocks[2].hash));
        CHECK_FALSE(storage.GetCanonicalHash(3));

        // The same commit succeeds once the backend recovers
        REQUIRE(Commit(storage, blocks[2]));
        CHECK(storage.GetChainState()->head_level == 3);
    }

    SECTION("an ancestor missing from the block store is refused") {
        REQUIRE(storage.StoreHeader(blocks[0].header));
        CHECK_FALSE(Commit(storage, blocks[2]));
        CHECK(storage.GetChainState()->head_level == 0);
        CHECK_FALSE(storage.IsApplied(blocks[2].hash));
    }

    SECTION("a longer fork rewrites the level index to the fork point") {
        CommitAll(storage, blocks);
        auto fork = BuildChain(blocks[1].header, 4, 1, 1);

        // Levels 3..5 do not beat the head
        for (int i = 0; i < 3; ++i) {
            auto outcome = Commit(storage, fork[i]);
            REQUIRE(outcome);
            CHECK_FALSE(outcome->head_advanced);
            CHECK(outcome->state.head_hash == blocks[4].hash);
            CHECK(storage.IsApplied(fork[i].hash));
            CHECK(storage.IsCanonical(blocks[i + 2].hash, blocks[i + 2].header.level));
        }

        auto outcome = Commit(storage, fork[3]);
        REQUIRE(outcome);
        CHECK(outcome->head_advanced);
        CHECK(outcome->state.head_hash == fork[3].hash);
        CHECK(outcome->state.head_level == 6);

        CHECK(storage.IsCanonical(blocks[0].hash, 1));
        CHECK(storage.IsCanonical(blocks[1].hash, 2));
        for (const auto &block : fork) {
            CHECK(storage.IsCanonical(block.hash, block.header.level));
        }
        // The old branch stays applied, just not canonical
        CHECK(storage.IsApplied(blocks[4].hash));
        CHECK_FALSE(storage.IsCanonical(blocks[4].hash, 5));
    }
}

TEST_CASE("ChainStorage - checkpoint and pruning", "[storage][unit]") {
    auto params = chain::ChainParams::CreateSandbox();
    MemoryStore store;
    ChainStorage storage(store, params->GetChainId());
    REQUIRE(storage.Initialize(*params));

    auto blocks = BuildChain(params->GenesisBlock(), 10);
    CommitAll(storage, blocks, 3);

    auto state = storage.GetChainState();
    REQUIRE(state);
    CHECK(state->head_level == 10);
    CHECK(state->checkpoint_level == 7);

    SECTION("pruning is clamped to the checkpoint") {
        CHECK(storage.PruneBelow(100) == 6);

        for (int i = 0; i < 6; ++i) {
            CHECK_FALSE(storage.HasOperations(blocks[i].hash, 0));
            CHECK_FALSE(storage.GetContext(blocks[i].hash));
            // Headers and metadata stay
            CHECK(storage.IsApplied(blocks[i].hash));
        }
        for (int i = 6; i < 10; ++i) {
            CHECK(storage.HasOperations(blocks[i].hash, 0));
            CHECK(storage.GetContext(blocks[i].hash));
        }
        CHECK(storage.GetContext(params->GenesisHash()) == params->GenesisContext());
        CHECK(storage.GetChainState() == state);

        // Already pruned up to there
        CHECK(storage.PruneBelow(7) == 0);
    }

    SECTION("prune write failure") {
        store.FailNextWrites(1);
        CHECK(storage.PruneBelow(5) == -1);
        CHECK(storage.HasOperations(blocks[0].hash, 0));
    }

    SECTION("the head never moves across the checkpoint") {
        // Fork off level 5, below the checkpoint
        auto fork = BuildChain(blocks[4].header, 7, 1, 2);
        for (int i = 0; i < 5; ++i) {
            REQUIRE(Commit(storage, fork[i]));
        }
        CHECK_FALSE(Commit(storage, fork[5]));
        CHECK(storage.GetChainState() == state);
        CHECK_FALSE(storage.IsApplied(fork[5].hash));
    }

    SECTION("unapplied headers below the checkpoint are not recovered") {
        auto stale = BuildChain(blocks[2].header, 1, 1, 3);
        REQUIRE(storage.StoreHeader(stale[0].header));
        CHECK(storage.LoadUnappliedHeaders().empty());
    }
}

TEST_CASE("ChainStorage - recovery and branch history", "[storage][unit]") {
    auto params = chain::ChainParams::CreateSandbox();
    MemoryStore store;
    ChainStorage storage(store, params->GetChainId());
    REQUIRE(storage.Initialize(*params));

    auto blocks = BuildChain(params->GenesisBlock(), 10);

    SECTION("unapplied headers come back sorted by level") {
        CommitAll(storage, {blocks.begin(), blocks.begin() + 2});
        REQUIRE(storage.StoreHeader(blocks[4].header));
        REQUIRE(storage.StoreHeader(blocks[2].header));
        REQUIRE(storage.StoreHeader(blocks[3].header));

        auto headers = storage.LoadUnappliedHeaders();
        REQUIRE(headers.size() == 3);
        CHECK(headers[0].GetHash() == blocks[2].hash);
        CHECK(headers[1].GetHash() == blocks[3].hash);
        CHECK(headers[2].GetHash() == blocks[4].hash);
    }

    SECTION("history doubles its step back to genesis") {
        CommitAll(storage, blocks);

        auto history = storage.GetBranchHistory(16);
        REQUIRE(history.size() == 5);
        CHECK(history[0] == blocks[8].hash);  // 9
        CHECK(history[1] == blocks[7].hash);  // 8
        CHECK(history[2] == blocks[5].hash);  // 6
        CHECK(history[3] == blocks[1].hash);  // 2
        CHECK(history[4] == params->GenesisHash());

        auto capped = storage.GetBranchHistory(3);
        REQUIRE(capped.size() == 3);
        CHECK(capped[2] == blocks[5].hash);

        CHECK(storage.GetBranchHistory(0).empty());
    }

    SECTION("a head at level one lists only genesis") {
        CommitAll(storage, {blocks[0]});
        auto history = storage.GetBranchHistory(16);
        REQUIRE(history.size() == 1);
        CHECK(history[0] == params->GenesisHash());
    }
}

TEST_CASE("RocksDbStore - state survives a reopen", "[storage][rocksdb]") {
    test::TempDir dir("rocksdb");
    const auto path = dir.path() / "blocks";
    auto params = chain::ChainParams::CreateSandbox();
    auto blocks = BuildChain(params->GenesisBlock(), 3, 2);

    {
        RocksDbStore store(path);
        CHECK(store.Path() == path);
        ChainStorage storage(store, params->GetChainId());
        REQUIRE(storage.Initialize(*params));
        CommitAll(storage, blocks);

        WriteBatch batch;
        batch.Put("zz", "1");
        batch.Delete("zz");
        REQUIRE(store.Write(batch));
        CHECK_FALSE(store.Exists("zz"));

        SECTION("a second handle on an open store is refused") {
            CHECK_THROWS_AS(RocksDbStore(path), StorageError);
        }
    }

    RocksDbStore reopened(path);
    ChainStorage storage(reopened, params->GetChainId());
    REQUIRE(storage.Initialize(*params));
    auto state = storage.GetChainState();
    REQUIRE(state);
    CHECK(state->head_hash == blocks[2].hash);
    CHECK(state->head_level == 3);
    for (const auto &block : blocks) {
        CHECK(storage.IsCanonical(block.hash, block.header.level));
        CHECK(storage.GetOperations(block.hash, 1) == block.operations[1]);
    }
    CHECK(storage.LoadUnappliedHeaders().empty());
}
