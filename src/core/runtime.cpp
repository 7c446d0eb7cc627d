// src/core/runtime.cpp
#include "agentflow/core/runtime.h"
#include "agentflow/common/logging.h"
#include "agentflow/core/errors.h"
#include <spdlog/spdlog.h>

namespace agentflow {

AgentRuntime::AgentRuntime(RuntimeConfig config, MemoryProvider* memory)
    : config_(std::move(config)),
      memory_(memory),
      monitor_(),
      router_(&monitor_),
      registry_(&monitor_),
      extractor_(router_, &monitor_, config_.extraction_max_attempts),
      planner_(config_.planner_config(), registry_, router_, &monitor_, memory_),
      executor_(config_.executor_config(), registry_, planner_, router_, &extractor_, &monitor_, memory_) {
    set_log_level(parse_log_level(config_.log_level));
    router_.set_default_timeout(std::chrono::milliseconds(config_.capability_timeout_ms));

    EventQueue::Config queue_config;
    queue_config.worker_count = config_.worker_count;
    queue_ = std::make_unique<EventQueue>(
        queue_config,
        [this](const Event& event) { executor_.run(event); },
        &monitor_);
}

AgentRuntime::~AgentRuntime() {
    shutdown();
}

std::unique_ptr<AgentRuntime> AgentRuntime::from_config_file(const std::string& config_path,
                                                             MemoryProvider* memory) {
    return std::make_unique<AgentRuntime>(load_runtime_config(config_path), memory);
}

void AgentRuntime::register_plugin(Plugin plugin) {
    registry_.register_plugin(std::move(plugin));
}

void AgentRuntime::register_capability(Capability capability) {
    if (started_) {
        throw RegistryClosed("Cannot register capability '" + capability.id + "' after start()");
    }
    router_.register_capability(std::move(capability));
}

void AgentRuntime::add_monitor_sink(std::shared_ptr<MonitorSink> sink) {
    monitor_.add_sink(std::move(sink));
}

void AgentRuntime::start() {
    if (started_) {
        return;
    }
    if (stopped_) {
        throw QueueClosed("Runtime has been shut down");
    }
    try {
        registry_.initialize(router_);
    } catch (const std::exception& e) {
        spdlog::critical("Runtime startup failed: {}", e.what());
        throw;
    }
    started_ = true;
    queue_->start();
    monitor_.publish("runtime.started", "", {{"workers", config_.worker_count}});
}

void AgentRuntime::shutdown() {
    if (!queue_ || stopped_) {
        return;
    }
    stopped_ = true;
    queue_->shutdown();
    if (started_) {
        monitor_.publish("runtime.stopped", "");
    }
    monitor_.flush();
}

void AgentRuntime::submit(Event event) {
    queue_->submit(std::move(event));
}

void AgentRuntime::wait_idle() {
    queue_->wait_idle();
}

RunOutcome AgentRuntime::run_sync(const Event& event) const {
    validate_event(event);
    return executor_.run(event);
}

nlohmann::json AgentRuntime::invoke(const std::string& capability,
                                    const nlohmann::json& input,
                                    const nlohmann::json& config,
                                    std::optional<std::chrono::milliseconds> timeout) const {
    return router_.invoke(capability, input, config, timeout);
}

ExtractionResult AgentRuntime::extract(const std::string& capability,
                                       const Schema& schema,
                                       const std::string& instruction,
                                       const nlohmann::json& config,
                                       std::optional<int> max_attempts) const {
    return extractor_.extract(capability, schema, instruction, config, max_attempts);
}

} // namespace agentflow
