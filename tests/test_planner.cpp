// tests/test_planner.cpp
#include <catch2/catch_test_macros.hpp>
#include "agentflow/capability/capability_router.h"
#include "agentflow/core/errors.h"
#include "agentflow/core/types/event.h"
#include "agentflow/memory/memory_provider.h"
#include "agentflow/planner/pipeline_planner.h"
#include "agentflow/registry/plugin_registry.h"
#include "test_helpers.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace agentflow;
using agentflow::testing::echo_plugin;
using agentflow::testing::make_event;
using agentflow::testing::plan_of;
using agentflow::testing::ScriptedCapability;

namespace {

struct PlannerFixture {
    PluginRegistry registry;
    CapabilityRouter router;
    ScriptedCapability model;
    ContextChain chain;

    PlannerFixture() {
        registry.register_plugin(echo_plugin("p-text", {"reply", "summarize"}));
        chain.append(make_seed_item(make_event("e1", "hello", std::string("alice"))));
    }

    void with_planning() { router.register_capability(model.as_capability("planning", {"plan"})); }
};

} // namespace

TEST_CASE("Planner turns capability output into a pipeline", "[planner]") {
    PlannerFixture f;
    f.with_planning();
    PipelinePlanner planner({}, f.registry, f.router);

    f.model.queue_plan(plan_of({{"p-text", "summarize"}, {"p-text", "reply"}}));
    auto pipeline = planner.plan(f.chain, f.registry.available_steps());

    REQUIRE(pipeline.size() == 2);
    REQUIRE(pipeline[0] == PipelineStep{"p-text", "summarize"});
    REQUIRE(pipeline[1] == PipelineStep{"p-text", "reply"});

    auto input = f.model.input(0);
    REQUIRE(input["mode"] == "plan");
    REQUIRE(input["available_steps"].size() == 2);
    REQUIRE(input["chain"][0]["id"] == "e1");
    REQUIRE(input["prompt"].get<std::string>().find("p-text.reply") != std::string::npos);
}

TEST_CASE("Planner accepts string step references and text output", "[planner]") {
    PlannerFixture f;
    f.with_planning();
    PipelinePlanner planner({}, f.registry, f.router);

    f.model.queue_plan(nlohmann::json::array({"p-text.reply", "p-text.reply"}));
    auto pipeline = planner.plan(f.chain, f.registry.available_steps());
    REQUIRE(pipeline.size() == 2); // 重复步骤保留

    f.model.queue_plan("Here is the plan:\n```json\n{\"steps\": [{\"pluginId\": \"p-text\", \"action\": \"summarize\"}]}\n```");
    pipeline = planner.plan(f.chain, f.registry.available_steps());
    REQUIRE(pipeline.size() == 1);
    REQUIRE(pipeline.front().action == "summarize");

    f.model.queue_plan({{"steps", nlohmann::json::array()}});
    REQUIRE(planner.plan(f.chain, f.registry.available_steps()).empty());
}

TEST_CASE("Planner rejects plans with unknown steps", "[planner]") {
    PlannerFixture f;
    f.with_planning();
    PipelinePlanner planner({}, f.registry, f.router);

    f.model.queue_plan(plan_of({{"p-text", "reply"}, {"p-text", "translate"}}));
    REQUIRE_THROWS_AS(planner.plan(f.chain, f.registry.available_steps()), PlanningError);

    f.model.queue_plan({{"no_steps_here", true}});
    REQUIRE_THROWS_AS(planner.plan(f.chain, f.registry.available_steps()), PlanningError);

    f.model.queue_plan("not a plan at all");
    REQUIRE_THROWS_AS(planner.plan(f.chain, f.registry.available_steps()), PlanningError);

    // 步骤必须在给出的可用集合内
    f.model.queue_plan(plan_of({{"p-text", "reply"}}));
    REQUIRE_THROWS_AS(planner.plan(f.chain, {}), PlanningError);
}

TEST_CASE("Planning without a planning capability fails", "[planner]") {
    PlannerFixture f;
    PipelinePlanner planner({}, f.registry, f.router);
    REQUIRE_THROWS_AS(planner.plan(f.chain, f.registry.available_steps()), PlanningError);
    REQUIRE(f.model.calls() == 0);
}

TEST_CASE("Capability failure becomes a PlanningError", "[planner]") {
    PlannerFixture f;
    f.with_planning();
    PipelinePlanner planner({}, f.registry, f.router);
    f.model.queue_plan("!error");
    REQUIRE_THROWS_AS(planner.plan(f.chain, f.registry.available_steps()), PlanningError);
}

TEST_CASE("Replan decisions", "[planner][replan]") {
    PlannerFixture f;
    f.with_planning();
    PipelinePlanner planner({}, f.registry, f.router);
    Pipeline remaining{{"p-text", "reply"}};

    SECTION("continue keeps the remaining steps") {
        f.model.queue_replan({{"decision", "continue"}});
        auto decision = planner.should_replan(f.chain, remaining);
        REQUIRE_FALSE(decision.is_replace());
        REQUIRE(f.model.input(0)["mode"] == "replan");
        REQUIRE(f.model.input(0)["remaining"][0]["action"] == "reply");
    }
    SECTION("replace carries validated steps and a reason") {
        f.model.queue_replan({{"decision", "replace"},
                              {"steps", {"p-text.summarize"}},
                              {"reason", "too long"}});
        auto decision = planner.should_replan(f.chain, remaining);
        REQUIRE(decision.is_replace());
        REQUIRE(decision.reason == "too long");
        REQUIRE(decision.steps.size() == 1);
        REQUIRE(decision.steps.front().action == "summarize");
    }
    SECTION("replace with an unknown step is rejected") {
        f.model.queue_replan({{"decision", "replace"}, {"steps", {"p-none.run"}}});
        REQUIRE_THROWS_AS(planner.should_replan(f.chain, remaining), PlanningError);
    }
    SECTION("unknown decision is rejected") {
        f.model.queue_replan({{"decision", "maybe"}});
        REQUIRE_THROWS_AS(planner.should_replan(f.chain, remaining), PlanningError);
    }
}

TEST_CASE("Replanning can be disabled", "[planner][replan]") {
    PlannerFixture f;
    f.with_planning();
    PipelinePlanner::Config config;
    config.replan_enabled = false;
    PipelinePlanner planner(config, f.registry, f.router);

    f.model.queue_replan({{"decision", "replace"}, {"steps", nlohmann::json::array()}});
    REQUIRE_FALSE(planner.should_replan(f.chain, {}).is_replace());
    REQUIRE(f.model.calls() == 0);
}

TEST_CASE("Planner input includes recent conversation history", "[planner][memory]") {
    PlannerFixture f;
    f.with_planning();
    InMemoryMemoryProvider memory;
    memory.store_user_interaction("alice", "cli", "first", 10);
    memory.store_user_interaction("alice", "cli", "second", 20);
    memory.store_user_interaction("alice", "cli", "third", 30);
    memory.store_user_interaction("bob", "cli", "other user", 15);

    PipelinePlanner::Config config;
    config.history_limit = 2;
    PipelinePlanner planner(config, f.registry, f.router, nullptr, &memory);

    planner.plan(f.chain, f.registry.available_steps());
    auto history = f.model.input(0)["history"];
    REQUIRE(history.size() == 2);
    REQUIRE(history[0]["content"] == "second");
    REQUIRE(history[1]["content"] == "third");
}

TEST_CASE("A planning capability timeout becomes a PlanningError", "[planner][timeout]") {
    PlannerFixture f;
    auto release = std::make_shared<std::atomic<bool>>(false);
    Capability slow;
    slow.id = "planning";
    slow.handler = [release](const nlohmann::json&, const nlohmann::json&) -> nlohmann::json {
        while (!release->load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return {{"steps", nlohmann::json::array()}};
    };
    f.router.register_capability(slow);

    PipelinePlanner::Config config;
    config.timeout = std::chrono::milliseconds(10);
    PipelinePlanner planner(config, f.registry, f.router);

    try {
        planner.plan(f.chain, f.registry.available_steps());
        release->store(true);
        FAIL("expected PlanningError");
    } catch (const PlanningError& e) {
        release->store(true);
        REQUIRE(std::string(e.what()).find("CapabilityTimeout") != std::string::npos);
    }
}
