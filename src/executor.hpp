#pragma once
#include "engine.hpp"
#include "function_router.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace sandlot {

enum class OutputType { None, Table, Dict, Scalar, Other };

const char* output_type_to_string(OutputType type);

enum class ExecutionErrorKind { SyntaxError, RuntimeError, UnexpectedAsyncPause };

const char* execution_error_kind_to_string(ExecutionErrorKind kind);

// The engine paused for an async wait inside synchronous code.
class UnexpectedAsyncPause : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Result of one code unit. Either output (possibly None) or error is set,
// never both; output_json is absent exactly when output is.
struct ExecutionOutcome {
    std::optional<Value> output;
    std::optional<std::string> output_json;
    OutputType output_type = OutputType::None;
    std::optional<std::string> error;
    std::optional<ExecutionErrorKind> error_kind;
    std::string code;
    std::optional<std::string> state_blob;

    bool ok() const { return !error.has_value(); }
};

// Shape-classify a completed run's output. Pure.
struct Classification {
    OutputType type = OutputType::None;
    std::optional<std::string> json;
};
Classification classify_output(const std::optional<Value>& output);

// {output_type, output_json, error, error_kind, code}; the state blob is
// left out.
nlohmann::json outcome_to_json(const ExecutionOutcome& outcome);

enum class BridgeState { Compiling, Running, Paused, Complete, Failed };

const char* bridge_state_to_string(BridgeState state);

// One code unit moving through the bridge state machine. Each step() makes
// exactly one transition: compile, run to the next pause or end, or serve
// the pending external call.
class ExecutionRun {
public:
    ExecutionRun(const Engine& engine, FunctionRouter& router,
                 std::string code, const ResourceLimits& limits);

    BridgeState state() const { return state_; }
    bool finished() const { return state_ == BridgeState::Complete || state_ == BridgeState::Failed; }

    // Advance one transition. Returns false once finished.
    bool step();

    // Valid once finished.
    const ExecutionOutcome& outcome() const { return outcome_; }

    // The call waiting to be served while Paused.
    const ExternalCall& pending_call() const { return pending_; }

private:
    void compile();
    void advance();
    void serve_call();
    void fail(ExecutionErrorKind kind, const std::string& message);
    bool over_budget() const;

    struct Resumption {
        bool is_error = false;
        Value value;
        std::string error_type;
        std::string error_message;
    };

    const Engine& engine_;
    FunctionRouter& router_;
    ResourceLimits limits_;
    std::chrono::steady_clock::time_point started_;

    BridgeState state_ = BridgeState::Compiling;
    std::unique_ptr<Execution> execution_;
    bool started_execution_ = false;
    ExternalCall pending_;
    std::optional<Resumption> resumption_;
    ExecutionOutcome outcome_;
};

// Runs code units to completion against the router's primitives.
class ExecutionBridge {
public:
    ExecutionBridge(const Engine& engine, FunctionRouter& router, ResourceLimits limits = {})
        : engine_(engine), router_(router), limits_(limits) {}

    // Never throws for faults in the code unit; they land in the outcome.
    ExecutionOutcome run(const std::string& code);

    const ResourceLimits& limits() const { return limits_; }

private:
    const Engine& engine_;
    FunctionRouter& router_;
    ResourceLimits limits_;
};

} // namespace sandlot
