// agentflow/core/types/run_outcome.h
#ifndef AGENTFLOW_CORE_TYPES_RUN_OUTCOME_H
#define AGENTFLOW_CORE_TYPES_RUN_OUTCOME_H

#include "agentflow/core/context_chain.h"
#include "agentflow/core/types/pipeline.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentflow {

enum class ExecutorState : uint8_t {
    PLANNING,
    RUNNING,
    REPLANNING,
    SUCCEEDED,
    FAILED
};

const char* to_string(ExecutorState state);

struct StepTrace {
    PipelineStep step;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::string status; // "success", "failed"
    std::optional<std::string> error;
    size_t items_appended = 0;
};

// 终止时交给 response handler 的结果
struct RunOutcome {
    std::string event_id;
    bool success = false;
    ExecutorState final_state = ExecutorState::PLANNING;
    std::string message; // error detail on failure
    ContextChain chain;
    std::vector<StepTrace> traces;
    int replan_count = 0;
};

} // namespace agentflow

#endif // AGENTFLOW_CORE_TYPES_RUN_OUTCOME_H
