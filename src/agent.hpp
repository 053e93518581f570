#pragma once
#include "provider.hpp"
#include "tool.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sandlot {

enum class AgentMessageKind { AssistantTurn, ToolResults };

struct ToolOutcome {
    std::string tool_call_id;
    std::string name;
    bool success = false;
    std::string output;
};

// AssistantTurn carries text_blocks and tool_calls of one reasoning turn,
// ToolResults the outcomes of that turn's tool calls.
struct AgentMessage {
    AgentMessageKind kind = AgentMessageKind::AssistantTurn;
    std::vector<std::string> text_blocks;
    std::vector<ToolCall> tool_calls;
    std::vector<ToolOutcome> results;
};

using AgentMessageCallback = std::function<void(const AgentMessage&)>;

struct AgentRequest {
    std::string system_prompt;
    std::string prompt;
};

// The reasoning loop. run() blocks until the agent stops and throws on
// faults; tools are executed on the calling thread.
class AgentRunner {
public:
    virtual ~AgentRunner() = default;

    virtual void run(const AgentRequest& request,
                     const std::vector<std::unique_ptr<Tool>>& tools,
                     const AgentMessageCallback& on_message) = 0;
};

// Drives a Provider turn by turn until it stops asking for tools or the
// turn budget runs out. Holds no per-run state.
class ProviderAgent : public AgentRunner {
public:
    ProviderAgent(Provider& provider, std::string model, double temperature,
                  uint32_t max_turns);

    void run(const AgentRequest& request,
             const std::vector<std::unique_ptr<Tool>>& tools,
             const AgentMessageCallback& on_message) override;

    const std::string& model() const { return model_; }

private:
    Provider& provider_;
    std::string model_;
    double temperature_;
    uint32_t max_turns_;
};

} // namespace sandlot
