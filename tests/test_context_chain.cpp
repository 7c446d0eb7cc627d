// tests/test_context_chain.cpp
#include <catch2/catch_test_macros.hpp>
#include "agentflow/common/utils.h"
#include "agentflow/core/context_chain.h"
#include "agentflow/core/errors.h"
#include "agentflow/core/types/event.h"
#include "test_helpers.h"
#include <set>

using namespace agentflow;
using agentflow::testing::make_event;
using agentflow::testing::text_item;

namespace {

ContextItem item_with_id(const std::string& id, const std::string& type = "text") {
    auto item = text_item("content of " + id, type);
    item.id = id;
    item.plugin_id = "p-text";
    item.action = "reply";
    item.timestamp = 1;
    return item;
}

} // namespace

TEST_CASE("ContextChain appends in order and indexes by id", "[context_chain]") {
    ContextChain chain;
    REQUIRE(chain.empty());

    chain.append(item_with_id("a"));
    chain.append(item_with_id("b"));
    chain.append(item_with_id("c", "summary"));

    REQUIRE(chain.size() == 3);
    REQUIRE(chain.front().id == "a");
    REQUIRE(chain.back().id == "c");
    REQUIRE(chain.contains("b"));
    REQUIRE_FALSE(chain.contains("z"));
    REQUIRE(chain.find("b")->content == "content of b");
    REQUIRE(chain.find("z") == nullptr);
    REQUIRE(chain.last_of_type("text")->id == "b");
    REQUIRE(chain.count_of_type("text") == 2);
    REQUIRE(chain.last_of_type("missing") == nullptr);
}

TEST_CASE("ContextChain rejects a duplicate id and keeps prior items", "[context_chain]") {
    ContextChain chain;
    chain.append(item_with_id("a"));
    REQUIRE_THROWS_AS(chain.append(item_with_id("a")), DuplicateItemId);
    REQUIRE(chain.size() == 1);
    REQUIRE(chain.at(0).content == "content of a");
}

TEST_CASE("ContextChain rejects items with a mismatched extension", "[context_chain]") {
    ContextChain chain;

    SECTION("error tag without an error payload") {
        REQUIRE_THROWS_AS(chain.append(item_with_id("e", item_types::ERROR)), InvalidContextItem);
    }
    SECTION("capability_result tag needs the capability id") {
        auto item = item_with_id("c", item_types::CAPABILITY_RESULT);
        item.extension = CapabilityExtension{"", 1};
        REQUIRE_THROWS_AS(chain.append(item), InvalidContextItem);
        item.extension = CapabilityExtension{"summarize", 2};
        REQUIRE_NOTHROW(chain.append(item));
    }
    SECTION("free-form tag cannot borrow a reserved payload") {
        auto item = item_with_id("x", "note");
        item.extension = ErrorExtension{"HandlerFailed", "p", "a", "boom"};
        REQUIRE_THROWS_AS(chain.append(item), InvalidContextItem);
    }
    SECTION("missing id or type") {
        REQUIRE_THROWS_AS(chain.append(item_with_id("")), InvalidContextItem);
        REQUIRE_THROWS_AS(chain.append(item_with_id("t", "")), InvalidContextItem);
    }
    REQUIRE(chain.count_of_type(item_types::ERROR) == 0);
}

TEST_CASE("make_error_item carries the failed step", "[context_chain]") {
    auto item = make_error_item("err-1", "HandlerFailed", "p-text", "reply", "boom");
    item.timestamp = 5;
    ContextChain chain;
    chain.append(item);

    const auto* ext = chain.back().extension_as<ErrorExtension>();
    REQUIRE(chain.back().is_error());
    REQUIRE(ext != nullptr);
    REQUIRE(ext->error_kind == "HandlerFailed");
    REQUIRE(ext->step_plugin == "p-text");
    REQUIRE(ext->step_action == "reply");

    auto j = chain.to_json();
    REQUIRE(j.size() == 1);
    REQUIRE(j[0]["extension"]["detail"] == "boom");
}

TEST_CASE("Seed item mirrors the event", "[context_chain][event]") {
    auto event = make_event("e1", "hi there", std::string("alice"));
    auto seed = make_seed_item(event);

    REQUIRE(seed.id == "e1");
    REQUIRE(seed.type == item_types::USER_INPUT);
    REQUIRE(seed.content == "hi there");
    const auto* ext = seed.extension_as<UserInputExtension>();
    REQUIRE(ext != nullptr);
    REQUIRE(ext->user == std::optional<std::string>("alice"));
    REQUIRE(ext->platform["name"] == "cli");

    event.type = "timer";
    auto timer_seed = make_seed_item(event);
    REQUIRE(timer_seed.extension_as<GenericExtension>()->fields["user"] == "alice");
}

TEST_CASE("validate_event reports missing fields", "[event]") {
    REQUIRE_NOTHROW(validate_event(make_event("e1")));

    auto no_id = make_event("");
    REQUIRE_THROWS_AS(validate_event(no_id), InvalidEvent);

    auto no_time = make_event("e2");
    no_time.timestamp = 0;
    REQUIRE_THROWS_AS(validate_event(no_time), InvalidEvent);

    auto reserved = make_event("e3");
    reserved.type = item_types::ERROR;
    REQUIRE_THROWS_AS(validate_event(reserved), InvalidEvent);

    auto bad_platform = make_event("e4");
    bad_platform.platform = nlohmann::json::array();
    REQUIRE_THROWS_AS(validate_event(bad_platform), InvalidEvent);
}

TEST_CASE("Conversation key groups by user and platform", "[event]") {
    auto a = make_event("e1", "x", std::string("alice"));
    auto b = make_event("e2", "y", std::string("alice"));
    auto anon1 = make_event("e3");
    auto anon2 = make_event("e4");

    REQUIRE(conversation_key(a) == "alice:cli");
    REQUIRE(conversation_key(a) == conversation_key(b));
    REQUIRE(conversation_key(anon1) != conversation_key(anon2));
}

TEST_CASE("generate_id does not repeat", "[utils]") {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(generate_id("item"));
    }
    REQUIRE(ids.size() == 1000);
}

TEST_CASE("extract_json finds JSON in model output", "[utils]") {
    REQUIRE(extract_json("{\"a\": 1}")->at("a") == 1);
    REQUIRE(extract_json("Sure!\n```json\n{\"b\": 2}\n```")->at("b") == 2);
    REQUIRE(extract_json("answer: [1, 2, 3] done")->size() == 3);
    REQUIRE_FALSE(extract_json("no json here").has_value());
}

TEST_CASE("Error types report their kind and keep their base", "[errors]") {
    try {
        throw CapabilityTimeout("slow");
    } catch (const CapabilityError& e) {
        REQUIRE(std::string(e.kind()) == "CapabilityTimeout");
    }
    const Error& step = UnknownStep("p.a");
    REQUIRE(std::string(step.kind()) == "UnknownStep");
    REQUIRE(std::string(ConfigError("x").kind()) == "ConfigError");
    REQUIRE(std::string(DuplicateItemId("x").what()) == "x");
}
