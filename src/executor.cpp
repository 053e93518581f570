#include "executor.hpp"
#include <iostream>

namespace sandlot {

const char* output_type_to_string(OutputType type) {
    switch (type) {
        case OutputType::None:   return "none";
        case OutputType::Table:  return "table";
        case OutputType::Dict:   return "dict";
        case OutputType::Scalar: return "scalar";
        case OutputType::Other:  return "other";
    }
    return "other";
}

const char* execution_error_kind_to_string(ExecutionErrorKind kind) {
    switch (kind) {
        case ExecutionErrorKind::SyntaxError:          return "SyntaxError";
        case ExecutionErrorKind::RuntimeError:         return "RuntimeError";
        case ExecutionErrorKind::UnexpectedAsyncPause: return "UnexpectedAsyncPause";
    }
    return "RuntimeError";
}

const char* bridge_state_to_string(BridgeState state) {
    switch (state) {
        case BridgeState::Compiling: return "compiling";
        case BridgeState::Running:   return "running";
        case BridgeState::Paused:    return "paused";
        case BridgeState::Complete:  return "complete";
        case BridgeState::Failed:    return "failed";
    }
    return "failed";
}

// ── Output classification ────────────────────────────────────────

Classification classify_output(const std::optional<Value>& output) {
    Classification c;
    if (!output || output->is_none()) return c;

    const Value& v = *output;
    if (v.is_sequence() && !v.items().empty() && v.items().front().is_dict()) {
        c.type = OutputType::Table;
    } else if (v.is_dict()) {
        c.type = OutputType::Dict;
    } else if (v.is_numeric() || v.is_str()) {
        c.type = OutputType::Scalar;
    } else {
        c.type = OutputType::Other;
    }

    try {
        c.json = to_json(v).dump();
    } catch (const std::invalid_argument&) {
        c.type = OutputType::Other;
    } catch (const nlohmann::json::type_error&) {
        c.type = OutputType::Other;
    }
    if (!c.json) {
        // Unserialisable shape or invalid UTF-8: fall back to the text form.
        c.json = nlohmann::json(v.str()).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    return c;
}

nlohmann::json outcome_to_json(const ExecutionOutcome& outcome) {
    nlohmann::json j;
    j["output_type"] = output_type_to_string(outcome.output_type);
    j["output_json"] = outcome.output_json ? nlohmann::json(*outcome.output_json) : nlohmann::json();
    j["error"] = outcome.error ? nlohmann::json(*outcome.error) : nlohmann::json();
    j["error_kind"] = outcome.error_kind
        ? nlohmann::json(execution_error_kind_to_string(*outcome.error_kind))
        : nlohmann::json();
    j["code"] = outcome.code;
    return j;
}

// ── ExecutionRun ─────────────────────────────────────────────────

ExecutionRun::ExecutionRun(const Engine& engine, FunctionRouter& router,
                           std::string code, const ResourceLimits& limits)
    : engine_(engine), router_(router), limits_(limits),
      started_(std::chrono::steady_clock::now()) {
    outcome_.code = std::move(code);
}

bool ExecutionRun::over_budget() const {
    return std::chrono::steady_clock::now() - started_ > limits_.max_duration;
}

void ExecutionRun::fail(ExecutionErrorKind kind, const std::string& message) {
    outcome_.output.reset();
    outcome_.output_json.reset();
    outcome_.output_type = OutputType::None;
    outcome_.state_blob.reset();
    outcome_.error = message;
    outcome_.error_kind = kind;
    execution_.reset();
    state_ = BridgeState::Failed;
}

bool ExecutionRun::step() {
    if (finished()) return false;

    if (state_ != BridgeState::Compiling && over_budget()) {
        fail(ExecutionErrorKind::RuntimeError,
             "Runtime error: TimeoutError: execution exceeded the time limit of " +
                 std::to_string(limits_.max_duration.count()) + " ms");
        return false;
    }

    try {
        switch (state_) {
            case BridgeState::Compiling: compile(); break;
            case BridgeState::Running:   advance(); break;
            case BridgeState::Paused:    serve_call(); break;
            case BridgeState::Complete:
            case BridgeState::Failed:    break;
        }
    } catch (const UnexpectedAsyncPause& e) {
        fail(ExecutionErrorKind::UnexpectedAsyncPause, e.what());
    } catch (const ScriptRuntimeError& e) {
        fail(ExecutionErrorKind::RuntimeError, std::string("Runtime error: ") + e.what());
    } catch (const std::exception& e) {
        fail(ExecutionErrorKind::RuntimeError, e.what());
    }
    return !finished();
}

void ExecutionRun::compile() {
    try {
        execution_ = engine_.compile(outcome_.code, FunctionRouter::function_names(), limits_);
    } catch (const ScriptSyntaxError& e) {
        fail(ExecutionErrorKind::SyntaxError, std::string("Syntax error: ") + e.what());
        return;
    }
    state_ = BridgeState::Running;
}

void ExecutionRun::advance() {
    Progress progress;
    if (!started_execution_) {
        started_execution_ = true;
        progress = execution_->start();
    } else if (resumption_ && resumption_->is_error) {
        auto r = std::move(*resumption_);
        resumption_.reset();
        progress = execution_->resume_error(r.error_type, r.error_message);
    } else {
        Value value = resumption_ ? std::move(resumption_->value) : Value::none();
        resumption_.reset();
        progress = execution_->resume(std::move(value));
    }

    switch (progress.kind) {
        case ProgressKind::ExternalCall:
            pending_ = std::move(progress.call);
            state_ = BridgeState::Paused;
            return;
        case ProgressKind::AsyncPause:
            throw UnexpectedAsyncPause("Unexpected async pause in sync execution");
        case ProgressKind::Complete:
            break;
    }

    std::optional<Value> output;
    if (!progress.output.is_none()) output = std::move(progress.output);
    auto classification = classify_output(output);
    outcome_.output = std::move(output);
    outcome_.output_type = classification.type;
    outcome_.output_json = std::move(classification.json);
    outcome_.state_blob = execution_->dump();
    execution_.reset();
    state_ = BridgeState::Complete;
}

void ExecutionRun::serve_call() {
    Resumption r;
    try {
        r.value = router_.dispatch(pending_.function_name, pending_.args, pending_.kwargs);
    } catch (const RouterError& e) {
        r.is_error = true;
        r.error_type = router_error_kind_to_string(e.kind());
        r.error_message = e.what();
    } catch (const std::exception& e) {
        r.is_error = true;
        r.error_type = "RuntimeError";
        r.error_message = e.what();
    }
    if (r.is_error) {
        std::cerr << "[executor] " << pending_.function_name << "() failed: "
                  << r.error_type << ": " << r.error_message << "\n";
    }
    resumption_ = std::move(r);
    pending_ = ExternalCall{};
    state_ = BridgeState::Running;
}

// ── ExecutionBridge ──────────────────────────────────────────────

ExecutionOutcome ExecutionBridge::run(const std::string& code) {
    ExecutionRun run(engine_, router_, code, limits_);
    while (run.step()) {
    }
    if (run.outcome().error) {
        std::cerr << "[executor] Code unit failed: " << run.outcome().error->substr(0, 200) << "\n";
    }
    return run.outcome();
}

} // namespace sandlot
