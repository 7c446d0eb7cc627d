// tests/test_plugin_registry.cpp
#include <catch2/catch_test_macros.hpp>
#include "agentflow/capability/capability_router.h"
#include "agentflow/core/errors.h"
#include "agentflow/registry/plugin_registry.h"
#include "test_helpers.h"
#include <string>
#include <vector>

using namespace agentflow;
using agentflow::testing::echo_plugin;

namespace {

Capability constant_capability(std::string id, nlohmann::json value) {
    Capability cap;
    cap.id = std::move(id);
    cap.handler = [value](const nlohmann::json&, const nlohmann::json&) { return value; };
    return cap;
}

} // namespace

TEST_CASE("Registered actions are resolvable by (plugin, action)", "[registry]") {
    PluginRegistry registry;
    registry.register_plugin(echo_plugin("p-text", {"reply", "summarize"}));

    REQUIRE(registry.has_plugin("p-text"));
    REQUIRE(registry.has_step({"p-text", "reply"}));
    REQUIRE_FALSE(registry.has_step({"p-text", "translate"}));
    REQUIRE(registry.lookup("p-text", "reply").description == "Appends a marker item");

    REQUIRE_THROWS_AS(registry.lookup("p-text", "translate"), UnknownStep);
    REQUIRE_THROWS_AS(registry.lookup({"p-none", "reply"}), UnknownStep);
}

TEST_CASE("Duplicate plugin registration is rejected", "[registry]") {
    PluginRegistry registry;
    registry.register_plugin(echo_plugin("p-text", {"reply"}));
    REQUIRE_THROWS_AS(registry.register_plugin(echo_plugin("p-text", {"other"})), DuplicateRegistration);
    REQUIRE_THROWS_AS(registry.register_plugin(echo_plugin("", {"other"})), DuplicateRegistration);

    // 原注册保持不变
    REQUIRE(registry.has_step({"p-text", "reply"}));
    REQUIRE_FALSE(registry.has_step({"p-text", "other"}));
}

TEST_CASE("An action without a handler is rejected", "[registry]") {
    Plugin plugin;
    plugin.id = "p-broken";
    plugin.actions["noop"] = PluginAction{};
    PluginRegistry registry;
    REQUIRE_THROWS_AS(registry.register_plugin(plugin), DuplicateRegistration);
    REQUIRE_FALSE(registry.has_plugin("p-broken"));
}

TEST_CASE("available_steps follows registration order", "[registry]") {
    PluginRegistry registry;
    registry.register_plugin(echo_plugin("p-b", {"zeta", "alpha"}));
    registry.register_plugin(echo_plugin("p-a", {"one"}));

    auto steps = registry.available_steps();
    REQUIRE(steps.size() == 3);
    REQUIRE(steps[0].step() == PipelineStep{"p-b", "alpha"});
    REQUIRE(steps[1].step() == PipelineStep{"p-b", "zeta"});
    REQUIRE(steps[2].step() == PipelineStep{"p-a", "one"});
    REQUIRE(steps[0].to_json()["plugin"] == "p-b");
    REQUIRE(registry.plugin_ids() == std::vector<std::string>{"p-b", "p-a"});
}

TEST_CASE("Initialization registers capabilities before any init hook runs", "[registry][init]") {
    PluginRegistry registry;
    CapabilityRouter router;
    std::vector<std::string> log;

    // 第一个插件的 init 需要第二个插件声明的 capability
    Plugin first = echo_plugin("p-first", {"run"});
    first.init = [&log](PluginInitContext& ctx) {
        log.push_back("first:" + std::to_string(ctx.capabilities.has_capability("vision")));
    };

    Plugin second = echo_plugin("p-second", {"run"});
    second.capabilities.push_back(constant_capability("vision", "ok"));
    second.init = [&log](PluginInitContext& ctx) {
        log.push_back("second:" + std::to_string(ctx.registry.has_plugin("p-first")));
    };

    registry.register_plugin(std::move(first));
    registry.register_plugin(std::move(second));
    registry.initialize(router);

    REQUIRE(registry.initialized());
    REQUIRE(log == std::vector<std::string>{"first:1", "second:1"});
    REQUIRE(router.resolve("vision").provider == "p-second");

    auto providers = registry.list_capability_providers();
    REQUIRE(providers.size() == 1);
    REQUIRE(providers[0].plugin_id == "p-second");
    REQUIRE(providers[0].capability_id == "vision");
}

TEST_CASE("Registration closes once initialization starts", "[registry][init]") {
    PluginRegistry registry;
    CapabilityRouter router;

    SECTION("from an init hook") {
        Plugin plugin = echo_plugin("p-late", {"run"});
        plugin.init = [](PluginInitContext& ctx) {
            ctx.registry.register_plugin(echo_plugin("p-sneaky", {"run"}));
        };
        registry.register_plugin(std::move(plugin));
        REQUIRE_THROWS_AS(registry.initialize(router), RegistryClosed);
        REQUIRE_FALSE(registry.has_plugin("p-sneaky"));
    }
    SECTION("after initialization") {
        registry.initialize(router);
        REQUIRE_THROWS_AS(registry.register_plugin(echo_plugin("p-after", {"run"})), RegistryClosed);
        REQUIRE_THROWS_AS(registry.initialize(router), RegistryClosed);
    }
}

TEST_CASE("Missing required capability fails initialization", "[registry][init]") {
    PluginRegistry registry;
    CapabilityRouter router;
    Plugin plugin = echo_plugin("p-needs", {"run"});
    plugin.required_capabilities = {"speech"};
    registry.register_plugin(std::move(plugin));

    REQUIRE_THROWS_AS(registry.initialize(router), UnknownCapability);
    REQUIRE_FALSE(registry.initialized());
}

TEST_CASE("Conflicting capability declarations fail initialization", "[registry][init]") {
    PluginRegistry registry;
    CapabilityRouter router;
    Plugin a = echo_plugin("p-a", {"run"});
    a.capabilities.push_back(constant_capability("summarize", 1));
    Plugin b = echo_plugin("p-b", {"run"});
    b.capabilities.push_back(constant_capability("summarize", 2));
    registry.register_plugin(std::move(a));
    registry.register_plugin(std::move(b));

    REQUIRE_THROWS_AS(registry.initialize(router), CapabilityConflict);
}
