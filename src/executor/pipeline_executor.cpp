// src/executor/pipeline_executor.cpp
#include "agentflow/executor/pipeline_executor.h"
#include "agentflow/common/utils.h"
#include "agentflow/core/errors.h"
#include "agentflow/monitor/monitor_service.h"
#include <spdlog/spdlog.h>

namespace agentflow {

FailurePolicy parse_failure_policy(const std::string& name) {
    if (name == "halt") return FailurePolicy::HALT;
    if (name == "skip") return FailurePolicy::SKIP;
    throw ConfigError("Unknown failure policy '" + name + "' (expected 'halt' or 'skip')");
}

namespace {

// 规划阶段的错误没有对应的步骤，用 planner 占位
const PipelineStep PLANNER_STEP{"planner", "plan"};

nlohmann::json step_json(const PipelineStep& step) {
    return {{"plugin", step.plugin_id}, {"action", step.action}};
}

nlohmann::json pipeline_json(const Pipeline& pipeline) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& step : pipeline) {
        arr.push_back(step_json(step));
    }
    return arr;
}

} // namespace

PipelineExecutor::PipelineExecutor(Config config,
                                   const PluginRegistry& registry,
                                   const PipelinePlanner& planner,
                                   const CapabilityRouter& router,
                                   const StructuredExtractor* extractor,
                                   MonitorService* monitor,
                                   MemoryProvider* memory)
    : config_(config),
      registry_(registry),
      planner_(planner),
      router_(router),
      extractor_(extractor),
      monitor_(monitor),
      memory_(memory) {}

RunOutcome PipelineExecutor::run(const Event& event) const {
    return drive(event, std::nullopt);
}

RunOutcome PipelineExecutor::run(const Event& event, Pipeline initial) const {
    return drive(event, std::move(initial));
}

RunOutcome PipelineExecutor::drive(const Event& event, std::optional<Pipeline> initial) const {
    ExecutionSession session(event);
    spdlog::debug("Run '{}' started ({}.{})", event.id, event.plugin_id, event.action);
    publish("run.started", event.id, {{"plugin", event.plugin_id}, {"action", event.action}, {"type", event.type}});

    try {
        session.append(make_seed_item(event));
    } catch (const Error& e) {
        // 种子条目无效时无法建立链
        spdlog::error("Run '{}' could not seed its chain: {}", event.id, e.what());
        session.fail(e.kind(), {event.plugin_id, event.action}, e.what());
    }

    if (initial.has_value() && !session.terminated()) {
        session.pipeline() = std::move(*initial);
        session.transition(ExecutorState::RUNNING);
    }

    while (!session.terminated()) {
        switch (session.state()) {
            case ExecutorState::PLANNING:
                on_planning(session);
                break;
            case ExecutorState::RUNNING:
                on_running(session);
                break;
            case ExecutorState::REPLANNING:
                on_replanning(session);
                break;
            default:
                break;
        }
    }

    RunOutcome outcome = session.finish();
    if (outcome.success) {
        spdlog::info("Run '{}' succeeded: {} step(s), {} item(s)", event.id, outcome.traces.size(), outcome.chain.size());
    } else {
        spdlog::warn("Run '{}' failed: {}", event.id, outcome.message);
    }
    publish("run.completed", event.id,
            {{"success", outcome.success},
             {"state", to_string(outcome.final_state)},
             {"items", outcome.chain.size()},
             {"message", outcome.message}});

    deliver(event, outcome);
    return outcome;
}

void PipelineExecutor::on_planning(ExecutionSession& session) const {
    try {
        Pipeline pipeline = planner_.plan(session.chain(), registry_.available_steps());
        session.pipeline() = std::move(pipeline);
        session.transition(ExecutorState::RUNNING);
    } catch (const PlanningError& e) {
        session.fail(e.kind(), PLANNER_STEP, e.what());
    } catch (const std::exception& e) {
        session.fail("PlanningError", PLANNER_STEP, e.what());
    } catch (...) {
        session.fail("PlanningError", PLANNER_STEP, "unknown exception");
    }
}

void PipelineExecutor::on_running(ExecutionSession& session) const {
    auto& pipeline = session.pipeline();
    if (pipeline.empty()) {
        session.transition(ExecutorState::SUCCEEDED);
        return;
    }

    PipelineStep step = std::move(pipeline.front());
    pipeline.pop_front();
    const std::string& event_id = session.event().id;

    if (config_.max_steps >= 0 && session.steps_executed() >= config_.max_steps) {
        session.fail("BudgetExceeded", step,
                     "Step budget of " + std::to_string(config_.max_steps) + " exhausted before " + step.to_string());
        return;
    }

    const PluginAction* action = nullptr;
    try {
        action = &registry_.lookup(step);
    } catch (const UnknownStep& e) {
        // 损坏的步骤引用不可恢复
        session.fail(e.kind(), step, e.what());
        publish("step.failed", event_id, {{"step", step_json(step)}, {"error", e.what()}});
        return;
    }

    StepTrace& trace = session.begin_step(step);
    publish("step.started", event_id, {{"step", step_json(step)}});

    ActionContext ctx{session.event(), step, router_, extractor_, memory_};
    ActionResult result;
    try {
        result = action->handler(session.chain(), ctx);
    } catch (const std::exception& e) {
        result = ActionResult::failure(e.what());
    } catch (...) {
        result = ActionResult::failure("unknown exception");
    }

    if (!result.success) {
        session.end_step(trace, false, result.error, 0);
        handle_step_failure(session, step, "HandlerFailed", result.error);
        return;
    }

    size_t appended = 0;
    try {
        for (auto& item : result.items) {
            if (item.id.empty()) item.id = generate_id("item");
            if (item.plugin_id.empty()) item.plugin_id = step.plugin_id;
            if (item.action.empty()) item.action = step.action;
            if (item.timestamp == 0) item.timestamp = now_millis();
            session.append(std::move(item));
            ++appended;
        }
    } catch (const Error& e) {
        // 已追加的条目保留，链只增不减
        session.end_step(trace, false, std::string(e.what()), appended);
        handle_step_failure(session, step, e.kind(), e.what());
        return;
    }

    session.end_step(trace, true, std::nullopt, appended);
    spdlog::debug("Run '{}' step {} appended {} item(s)", event_id, step.to_string(), appended);
    publish("step.completed", event_id, {{"step", step_json(step)}, {"items", appended}});
    session.transition(ExecutorState::REPLANNING);
}

void PipelineExecutor::handle_step_failure(ExecutionSession& session,
                                           const PipelineStep& step,
                                           const std::string& error_kind,
                                           const std::string& detail) const {
    publish("step.failed", session.event().id,
            {{"step", step_json(step)}, {"error_kind", error_kind}, {"error", detail}});

    if (config_.failure_policy == FailurePolicy::SKIP) {
        spdlog::warn("Run '{}' step {} failed, skipping: {}", session.event().id, step.to_string(), detail);
        session.record_error(error_kind, step, detail);
        session.transition(ExecutorState::REPLANNING);
        return;
    }
    session.fail(error_kind, step, detail);
}

void PipelineExecutor::on_replanning(ExecutionSession& session) const {
    ReplanDecision decision;
    try {
        decision = planner_.should_replan(session.chain(), session.pipeline());
    } catch (const std::exception& e) {
        // 无效的重规划不丢弃原计划
        spdlog::warn("Run '{}' replanning rejected, keeping remaining steps: {}", session.event().id, e.what());
        decision = ReplanDecision::keep();
    } catch (...) {
        spdlog::warn("Run '{}' replanning threw a non-standard exception, keeping remaining steps",
                     session.event().id);
        decision = ReplanDecision::keep();
    }

    if (decision.is_replace()) {
        nlohmann::json payload = {{"discarded", pipeline_json(session.pipeline())},
                                  {"steps", pipeline_json(decision.steps)},
                                  {"reason", decision.reason}};
        spdlog::info("Run '{}' pipeline replaced ({} -> {} step(s)): {}", session.event().id,
                     session.pipeline().size(), decision.steps.size(), decision.reason);
        session.replace_pipeline(std::move(decision.steps));
        publish("pipeline.replaced", session.event().id, std::move(payload));
    }
    session.transition(ExecutorState::RUNNING);
}

void PipelineExecutor::deliver(const Event& event, const RunOutcome& outcome) const {
    if (!event.response_handler) {
        return;
    }
    try {
        event.response_handler(outcome);
    } catch (const std::exception& e) {
        spdlog::error("Response handler for '{}' threw: {}", event.id, e.what());
    } catch (...) {
        spdlog::error("Response handler for '{}' threw a non-standard exception", event.id);
    }
}

void PipelineExecutor::publish(const std::string& type, const std::string& event_id, nlohmann::json payload) const {
    if (monitor_) {
        monitor_->publish(type, event_id, std::move(payload));
    }
}

} // namespace agentflow
