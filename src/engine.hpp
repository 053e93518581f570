#pragma once
#include "engine/value.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sandlot {

// Code failed to parse. what() is the diagnostic, e.g. "line 3: invalid syntax".
class ScriptSyntaxError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Unhandled fault while running a code unit (including budget overruns).
// what() reads "line N: Type: message".
class ScriptRuntimeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ResourceLimits {
    std::chrono::milliseconds max_duration{30000};
    uint32_t max_call_depth = 200;
    size_t max_sequence_length = 10'000'000;
};

struct ExternalCall {
    std::string function_name;
    std::vector<Value> args;
    KwArgs kwargs;
};

enum class ProgressKind { ExternalCall, AsyncPause, Complete };

inline const char* progress_kind_to_string(ProgressKind kind) {
    switch (kind) {
        case ProgressKind::ExternalCall: return "external_call";
        case ProgressKind::AsyncPause: return "async_pause";
        case ProgressKind::Complete: return "complete";
    }
    return "complete";
}

// Where a started execution stopped. `call` is set for ExternalCall,
// `output` for Complete.
struct Progress {
    ProgressKind kind = ProgressKind::Complete;
    ExternalCall call;
    Value output;
};

// One started run of a compiled code unit. Each external call suspends the
// run; exactly one resume*() continues it.
class Execution {
public:
    virtual ~Execution() = default;

    virtual Progress start() = 0;
    virtual Progress resume(Value return_value) = 0;
    // Raise `error_type: message` at the suspended call site.
    virtual Progress resume_error(const std::string& error_type,
                                  const std::string& message) = 0;

    // Opaque capture of the execution state. Only meaningful after Complete.
    virtual std::string dump() const = 0;
};

// Interruptible execution engine. compile() throws ScriptSyntaxError and
// never runs any code; the listed names become callables that suspend.
class Engine {
public:
    virtual ~Engine() = default;

    virtual std::unique_ptr<Execution> compile(const std::string& code,
                                               const std::vector<std::string>& external_functions,
                                               const ResourceLimits& limits) const = 0;
};

} // namespace sandlot
