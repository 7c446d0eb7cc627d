// src/executor/execution_session.cpp
#include "agentflow/executor/execution_session.h"
#include "agentflow/common/utils.h"

namespace agentflow {

const char* to_string(ExecutorState state) {
    switch (state) {
        case ExecutorState::PLANNING: return "Planning";
        case ExecutorState::RUNNING: return "Running";
        case ExecutorState::REPLANNING: return "Replanning";
        case ExecutorState::SUCCEEDED: return "Succeeded";
        case ExecutorState::FAILED: return "Failed";
    }
    return "Unknown";
}

ExecutionSession::ExecutionSession(const Event& event) : event_(event) {}

void ExecutionSession::replace_pipeline(Pipeline steps) {
    pipeline_ = std::move(steps);
    ++replan_count_;
}

void ExecutionSession::record_error(const std::string& error_kind,
                                    const PipelineStep& step,
                                    const std::string& detail) {
    auto item = make_error_item(generate_id("error"), error_kind, step.plugin_id, step.action, detail);
    item.timestamp = now_millis();
    chain_.append(std::move(item));
    if (failure_message_.empty()) {
        failure_message_ = error_kind + ": " + detail;
    }
}

void ExecutionSession::fail(const std::string& error_kind,
                            const PipelineStep& step,
                            const std::string& detail) {
    record_error(error_kind, step, detail);
    failure_message_ = error_kind + ": " + detail;
    state_ = ExecutorState::FAILED;
}

StepTrace& ExecutionSession::begin_step(const PipelineStep& step) {
    ++steps_executed_;
    StepTrace trace;
    trace.step = step;
    trace.start_time = std::chrono::system_clock::now();
    trace.status = "running";
    traces_.push_back(std::move(trace));
    return traces_.back();
}

void ExecutionSession::end_step(StepTrace& trace, bool success, std::optional<std::string> error, size_t appended) {
    trace.end_time = std::chrono::system_clock::now();
    trace.status = success ? "success" : "failed";
    trace.error = std::move(error);
    trace.items_appended = appended;
}

RunOutcome ExecutionSession::finish() {
    RunOutcome outcome;
    outcome.event_id = event_.id;
    outcome.success = state_ == ExecutorState::SUCCEEDED;
    outcome.final_state = state_;
    outcome.message = outcome.success ? std::string("Run completed") : failure_message_;
    outcome.chain = std::move(chain_);
    outcome.traces = std::move(traces_);
    outcome.replan_count = replan_count_;
    pipeline_.clear();
    return outcome;
}

} // namespace agentflow
