#pragma once
#include "../engine.hpp"
#include <memory>
#include <string>
#include <vector>

namespace sandlot {

// Engine backed by the embedded CPython interpreter. Code units are checked
// against the accepted language surface at compile time and run on a worker
// thread with restricted builtins; each external name is a shim that hands
// the call to the host and blocks until the host resumes it.
class ScriptEngine : public Engine {
public:
    std::unique_ptr<Execution> compile(const std::string& code,
                                       const std::vector<std::string>& external_functions,
                                       const ResourceLimits& limits) const override;
};

} // namespace sandlot
