// agentflow/core/errors.h
#ifndef AGENTFLOW_CORE_ERRORS_H
#define AGENTFLOW_CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace agentflow {

// 所有运行时错误的基类，kind() 返回错误分类名
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
    virtual const char* kind() const noexcept { return "Error"; }
};

// Rejected before queueing
class InvalidEvent : public Error {
public:
    explicit InvalidEvent(const std::string& message) : Error(message) {}
    const char* kind() const noexcept override { return "InvalidEvent"; }
};

class QueueClosed : public Error {
public:
    explicit QueueClosed(const std::string& message) : Error(message) {}
    const char* kind() const noexcept override { return "QueueClosed"; }
};

// Startup-time configuration errors
class DuplicateRegistration : public Error {
public:
    explicit DuplicateRegistration(const std::string& message) : Error(message) {}
    const char* kind() const noexcept override { return "DuplicateRegistration"; }
};

class RegistryClosed : public Error {
public:
    explicit RegistryClosed(const std::string& message) : Error(message) {}
    const char* kind() const noexcept override { return "RegistryClosed"; }
};

class CapabilityConflict : public Error {
public:
    explicit CapabilityConflict(const std::string& message) : Error(message) {}
    const char* kind() const noexcept override { return "CapabilityConflict"; }
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message) : Error(message) {}
    const char* kind() const noexcept override { return "ConfigError"; }
};

// Reference to a non-existent registry entry
class UnknownStep : public Error {
public:
    explicit UnknownStep(const std::string& message) : Error(message) {}
    const char* kind() const noexcept override { return "UnknownStep"; }
};

class UnknownCapability : public Error {
public:
    explicit UnknownCapability(const std::string& message) : Error(message) {}
    const char* kind() const noexcept override { return "UnknownCapability"; }
};

class PlanningError : public Error {
public:
    explicit PlanningError(const std::string& message) : Error(message) {}
    const char* kind() const noexcept override { return "PlanningError"; }
};

// Capability handler failure; timeout is a special case of it
class CapabilityError : public Error {
public:
    explicit CapabilityError(const std::string& message) : Error(message) {}
    const char* kind() const noexcept override { return "CapabilityError"; }
};

class CapabilityTimeout : public CapabilityError {
public:
    explicit CapabilityTimeout(const std::string& message) : CapabilityError(message) {}
    const char* kind() const noexcept override { return "CapabilityTimeout"; }
};

// Context chain invariants
class InvalidContextItem : public Error {
public:
    explicit InvalidContextItem(const std::string& message) : Error(message) {}
    const char* kind() const noexcept override { return "InvalidContextItem"; }
};

class DuplicateItemId : public Error {
public:
    explicit DuplicateItemId(const std::string& message) : Error(message) {}
    const char* kind() const noexcept override { return "DuplicateItemId"; }
};

class ExtractionFailed : public Error {
public:
    ExtractionFailed(const std::string& message, int attempts, std::string last_error)
        : Error(message), attempts_(attempts), last_error_(std::move(last_error)) {}
    const char* kind() const noexcept override { return "ExtractionFailed"; }

    int attempts() const { return attempts_; }
    const std::string& last_error() const { return last_error_; }

private:
    int attempts_;
    std::string last_error_;
};

} // namespace agentflow

#endif // AGENTFLOW_CORE_ERRORS_H
