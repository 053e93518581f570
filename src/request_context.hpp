#pragma once
#include "event.hpp"
#include "event_queue.hpp"
#include "store/conversation_store.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sandlot {

// Everything one chat turn accumulates. Owned by its ChatStream; the agent
// thread writes it and the consumer reads it only after joining that thread
// (the queue is the exception, it is shared from the start).
struct RequestContext {
    std::string conversation_id;
    std::string user_message;
    EventQueue queue;

    uint64_t started_ms = 0;   // monotonic_ms() when the stream was created
    uint64_t last_span_ms = 0;
    std::vector<TimingSpan> spans;
    uint32_t turns = 0;
    uint32_t tool_calls = 0;

    std::vector<Artifact> pending_artifacts;
    std::vector<ToolTiming> tool_timings;
    std::string reply;
};

} // namespace sandlot
