// agentflow/core/types/pipeline.h
#ifndef AGENTFLOW_CORE_TYPES_PIPELINE_H
#define AGENTFLOW_CORE_TYPES_PIPELINE_H

#include <deque>
#include <string>

namespace agentflow {

// (plugin, action) 对，计划接受时必须存在于 PluginRegistry
struct PipelineStep {
    std::string plugin_id;
    std::string action;

    std::string to_string() const { return plugin_id + "." + action; }
    bool operator==(const PipelineStep&) const = default;
};

// Owned by exactly one executor run; replaced wholesale on replan
using Pipeline = std::deque<PipelineStep>;

} // namespace agentflow

#endif // AGENTFLOW_CORE_TYPES_PIPELINE_H
