// main.cpp
#include <iostream>
#include <fstream>
#include <memory>
#include <mutex>
#include <vector>
#include <nlohmann/json.hpp>
#include "agentflow/common/logging.h"
#include "agentflow/core/runtime.h"
#include "agentflow/memory/memory_provider.h"

using namespace agentflow;

namespace {

// 规则式 planning capability：问句先总结再回复，其他直接回复
nlohmann::json rule_based_planner(const nlohmann::json& input, const nlohmann::json&) {
    if (input.value("mode", "plan") == "replan") {
        return {{"decision", "continue"}};
    }
    const auto& seed = input["chain"].front();
    const std::string content = seed.value("content", "");
    nlohmann::json steps = nlohmann::json::array();
    if (!content.empty() && content.back() == '?') {
        steps.push_back("p-echo.summarize");
    }
    steps.push_back("p-echo.reply");
    return {{"steps", steps}};
}

Plugin make_echo_plugin() {
    Plugin plugin;
    plugin.id = "p-echo";
    plugin.add_action("summarize", [](const ContextChain& chain, ActionContext&) {
        ContextItem item;
        item.type = "summary";
        item.content = "question of " + std::to_string(chain.front().content.size()) + " chars";
        return ActionResult::ok({item});
    }, "Summarizes the user input");
    plugin.add_action("reply", [](const ContextChain& chain, ActionContext& ctx) {
        ContextItem item;
        item.type = "reply";
        item.content = "echo: " + chain.front().content;
        if (const auto* summary = chain.last_of_type("summary")) {
            item.content += " (" + summary->content + ")";
        }
        if (ctx.memory && ctx.event.user) {
            ctx.memory->store_user_interaction(*ctx.event.user, platform_name(ctx.event),
                                               chain.front().content, ctx.event.timestamp, ctx.event.id);
        }
        return ActionResult::ok({item});
    }, "Replies to the user");
    return plugin;
}

} // namespace

int main(int argc, char* argv[]) {
    init_logger();

    try {
        // 1. 配置
        InMemoryMemoryProvider memory;
        auto runtime = argc > 1 ? AgentRuntime::from_config_file(argv[1], &memory)
                                : std::make_unique<AgentRuntime>(RuntimeConfig{}, &memory);

        // 2. 注册插件与 capability
        runtime->register_capability("planning", {"plan"}, rule_based_planner);
        runtime->register_plugin(make_echo_plugin());
        runtime->start();

        // 3. 提交事件
        std::mutex out_mutex;
        nlohmann::json outcomes = nlohmann::json::array();
        const std::vector<std::pair<std::string, std::string>> messages = {
            {"alice", "hello there"},
            {"bob", "what time is it?"},
            {"alice", "are you listening?"},
        };
        int counter = 0;
        for (const auto& [user, text] : messages) {
            Event event;
            event.id = "evt-" + std::to_string(++counter);
            event.plugin_id = "p-cli";
            event.action = "receive";
            event.type = item_types::USER_INPUT;
            event.content = text;
            event.timestamp = counter * 1000;
            event.user = user;
            event.platform = nlohmann::json{{"name", "cli"}};
            event.response_handler = [&out_mutex, &outcomes](const RunOutcome& outcome) {
                std::lock_guard<std::mutex> lock(out_mutex);
                outcomes.push_back({{"event", outcome.event_id},
                                    {"success", outcome.success},
                                    {"message", outcome.message},
                                    {"chain", outcome.chain.to_json()}});
            };
            runtime->submit(std::move(event));
        }

        // 4. 等待并输出
        runtime->wait_idle();
        runtime->shutdown();

        std::cout << outcomes.dump(2) << "\n";
        std::ofstream out("echo_outcomes.json");
        out << outcomes.dump(2) << std::endl;
    } catch (const std::exception& e) {
        spdlog::critical("echo_agent failed: {}", e.what());
        return 1;
    }
    return 0;
}
