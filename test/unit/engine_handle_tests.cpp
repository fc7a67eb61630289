// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license
// EngineHandle tests: lazy creation, garbage collection cadence, restarts

#include "test_helpers.hpp"
#include "validation/engine_handle.hpp"
#include <catch2/catch_test_macros.hpp>
#include <stdexcept>

using namespace stakenode;
using namespace stakenode::validation;

namespace {

// Behaviour shared by every engine instance the factory creates
struct EngineScript {
    int created{0};
    int apply_calls{0};
    int gc_calls{0};
    int errors_left{0};
    bool always_error{false};
    bool reject{false};
    bool silent_reject{false};
    bool gc_fails{false};
    bool factory_throws{false};
    bool factory_empty{false};
};

class ScriptedEngine : public ValidationEngine {
public:
    explicit ScriptedEngine(EngineScript &script) : script_(script) {}

    bool ApplyBlock(const ApplyRequest &request, ApplyResult &result,
                    ValidationState &state) override {
        ++script_.apply_calls;
        if (script_.always_error || script_.errors_left > 0) {
            if (script_.errors_left > 0) {
                --script_.errors_left;
            }
            return state.Error("engine-crashed");
        }
        if (script_.reject) {
            return state.Invalid("bad-block");
        }
        if (script_.silent_reject) {
            return false;
        }
        result.context_hash = request.header.GetHash();
        return true;
    }

    bool CollectGarbage(ValidationState &state) override {
        ++script_.gc_calls;
        if (script_.gc_fails) {
            return state.Error("gc-failed");
        }
        return true;
    }

    std::string Name() const override { return "scripted"; }

private:
    EngineScript &script_;
};

EngineFactory FactoryFor(EngineScript &script) {
    return [&script]() -> std::unique_ptr<ValidationEngine> {
        if (script.factory_throws) {
            throw std::runtime_error("socket refused");
        }
        if (script.factory_empty) {
            return nullptr;
        }
        ++script.created;
        return std::make_unique<ScriptedEngine>(script);
    };
}

ApplyRequest MakeRequest() {
    auto params = chain::ChainParams::CreateSandbox();
    auto blocks = test::BuildChain(params->GenesisBlock(), 1);
    ApplyRequest request;
    request.chain_id = params->GetChainId();
    request.header = blocks[0].header;
    request.operations = blocks[0].operations;
    request.predecessor_context = params->GenesisContext();
    return request;
}

} // namespace

TEST_CASE("EngineHandle - lazy creation and success", "[validation][engine]") {
    EngineScript script;
    EngineHandle handle(FactoryFor(script), EngineHandleConfig{});
    CHECK_FALSE(handle.has_engine());
    CHECK(script.created == 0);

    const auto request = MakeRequest();
    ApplyResult result;
    ValidationState state;
    REQUIRE(handle.Apply(request, result, state));
    CHECK(state.IsValid());
    CHECK(result.context_hash == request.header.GetHash());
    CHECK(handle.has_engine());
    CHECK(handle.call_count() == 1);

    REQUIRE(handle.Apply(request, result, state));
    CHECK(script.created == 1);
    CHECK(handle.restart_count() == 0);
}

TEST_CASE("EngineHandle - garbage collection cadence", "[validation][engine]") {
    EngineScript script;
    const auto request = MakeRequest();
    ApplyResult result;
    ValidationState state;

    SECTION("every gc_interval calls") {
        EngineHandle handle(FactoryFor(script), EngineHandleConfig{3, 3});
        for (int i = 0; i < 7; ++i) {
            REQUIRE(handle.Apply(request, result, state));
        }
        CHECK(handle.gc_count() == 2);
        CHECK(script.gc_calls == 2);
    }

    SECTION("rejections count as calls") {
        script.reject = true;
        EngineHandle handle(FactoryFor(script), EngineHandleConfig{2, 3});
        CHECK_FALSE(handle.Apply(request, result, state));
        CHECK_FALSE(handle.Apply(request, result, state));
        CHECK(handle.gc_count() == 1);
    }

    SECTION("failed attempts count, a restart starts over") {
        script.errors_left = 1;
        EngineHandle handle(FactoryFor(script), EngineHandleConfig{3, 3});
        REQUIRE(handle.Apply(request, result, state));
        CHECK(handle.call_count() == 2);
        CHECK(handle.restart_count() == 1);

        // One call on the fresh engine so far; two more reach the interval
        REQUIRE(handle.Apply(request, result, state));
        CHECK(handle.gc_count() == 0);
        REQUIRE(handle.Apply(request, result, state));
        CHECK(handle.gc_count() == 1);
        CHECK(handle.call_count() == 4);
    }

    SECTION("interval zero never collects") {
        EngineHandle handle(FactoryFor(script), EngineHandleConfig{0, 3});
        for (int i = 0; i < 10; ++i) {
            REQUIRE(handle.Apply(request, result, state));
        }
        CHECK(script.gc_calls == 0);
    }

    SECTION("a failed collection replaces the engine") {
        script.gc_fails = true;
        EngineHandle handle(FactoryFor(script), EngineHandleConfig{1, 3});
        REQUIRE(handle.Apply(request, result, state));
        CHECK_FALSE(handle.has_engine());
        CHECK(handle.gc_count() == 0);
        CHECK(handle.restart_count() == 1);

        REQUIRE(handle.Apply(request, result, state));
        CHECK(script.created == 2);
    }
}

TEST_CASE("EngineHandle - restarts on call failure", "[validation][engine]") {
    EngineScript script;
    const auto request = MakeRequest();
    ApplyResult result;
    ValidationState state;

    SECTION("a crash is retried on a fresh engine") {
        script.errors_left = 2;
        EngineHandle handle(FactoryFor(script), EngineHandleConfig{100, 3});
        REQUIRE(handle.Apply(request, result, state));
        CHECK(state.IsValid());
        CHECK(handle.restart_count() == 2);
        CHECK(script.created == 3);
        CHECK(script.apply_calls == 3);
        CHECK(handle.call_count() == 3);
    }

    SECTION("exhausted restarts are an error") {
        script.always_error = true;
        EngineHandle handle(FactoryFor(script), EngineHandleConfig{100, 2});
        CHECK_FALSE(handle.Apply(request, result, state));
        CHECK(state.IsError());
        CHECK(state.GetRejectReason() == "engine-crashed");
        CHECK(script.apply_calls == 3);
        CHECK(handle.restart_count() == 2);
        CHECK(handle.call_count() == 3);
    }

    SECTION("an invalid block is not retried") {
        script.reject = true;
        EngineHandle handle(FactoryFor(script), EngineHandleConfig{100, 3});
        CHECK_FALSE(handle.Apply(request, result, state));
        CHECK(state.IsInvalid());
        CHECK(state.GetRejectReason() == "bad-block");
        CHECK(script.apply_calls == 1);
        CHECK(handle.restart_count() == 0);
    }

    SECTION("a refusal without a reason is still a rejection") {
        script.silent_reject = true;
        EngineHandle handle(FactoryFor(script), EngineHandleConfig{100, 3});
        CHECK_FALSE(handle.Apply(request, result, state));
        CHECK(state.IsInvalid());
        CHECK(state.GetRejectReason() == "rejected");
    }

    SECTION("an engine that cannot be created") {
        script.factory_throws = true;
        EngineHandle handle(FactoryFor(script), EngineHandleConfig{100, 1});
        CHECK_FALSE(handle.Apply(request, result, state));
        CHECK(state.IsError());
        CHECK(state.GetRejectReason() == "engine-unavailable");
        CHECK_FALSE(handle.has_engine());

        script.factory_throws = false;
        script.factory_empty = true;
        CHECK_FALSE(handle.Apply(request, result, state));
        CHECK(state.IsError());

        // Recovers once the engine comes back
        script.factory_empty = false;
        REQUIRE(handle.Apply(request, result, state));
        CHECK(script.created == 1);
    }
}
