// agentflow/executor/execution_session.h
#ifndef AGENTFLOW_EXECUTOR_EXECUTION_SESSION_H
#define AGENTFLOW_EXECUTOR_EXECUTION_SESSION_H

#include "agentflow/core/context_chain.h"
#include "agentflow/core/types/event.h"
#include "agentflow/core/types/pipeline.h"
#include "agentflow/core/types/run_outcome.h"
#include <optional>
#include <string>
#include <vector>

namespace agentflow {

// ExecutionSession 封装单次运行的全部状态：链、计划、状态机、Trace
// Owned by exactly one executor run; never shared between workers.
class ExecutionSession {
public:
    explicit ExecutionSession(const Event& event);

    ExecutorState state() const { return state_; }
    void transition(ExecutorState next) { state_ = next; }
    bool terminated() const {
        return state_ == ExecutorState::SUCCEEDED || state_ == ExecutorState::FAILED;
    }

    const Event& event() const { return event_; }
    const ContextChain& chain() const { return chain_; }
    const ContextItem& append(ContextItem item) { return chain_.append(std::move(item)); }

    Pipeline& pipeline() { return pipeline_; }
    const Pipeline& pipeline() const { return pipeline_; }
    void replace_pipeline(Pipeline steps);

    // Error item for the failed step; the caller decides the next state
    void record_error(const std::string& error_kind, const PipelineStep& step, const std::string& detail);
    void fail(const std::string& error_kind, const PipelineStep& step, const std::string& detail);

    StepTrace& begin_step(const PipelineStep& step);
    void end_step(StepTrace& trace, bool success, std::optional<std::string> error, size_t appended);

    int steps_executed() const { return steps_executed_; }
    int replan_count() const { return replan_count_; }
    const std::string& failure_message() const { return failure_message_; }

    // Moves the chain out; the session is finished afterwards
    RunOutcome finish();

private:
    const Event& event_;
    ExecutorState state_ = ExecutorState::PLANNING;
    ContextChain chain_;
    Pipeline pipeline_;
    std::vector<StepTrace> traces_;
    int steps_executed_ = 0;
    int replan_count_ = 0;
    std::string failure_message_;
};

} // namespace agentflow

#endif // AGENTFLOW_EXECUTOR_EXECUTION_SESSION_H
