#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sandlot {

// ── Stream events ───────────────────────────────────────────────

enum class StreamEventKind { Text, Code, Status, Error, Artifact, Done };

inline const char* stream_event_kind_to_string(StreamEventKind kind) {
    switch (kind) {
        case StreamEventKind::Text:     return "text";
        case StreamEventKind::Code:     return "code";
        case StreamEventKind::Status:   return "status";
        case StreamEventKind::Error:    return "error";
        case StreamEventKind::Artifact: return "artifact";
        case StreamEventKind::Done:     return "done";
    }
    return "error";
}

// One item delivered to the consumer of a chat turn. Artifact and done
// payloads are JSON text; the others are plain text.
struct StreamEvent {
    StreamEventKind kind = StreamEventKind::Status;
    std::string payload;
};

// ── Timing ──────────────────────────────────────────────────────

enum class SpanKind { Llm, Tool };

inline const char* span_kind_to_string(SpanKind kind) {
    return kind == SpanKind::Llm ? "llm" : "tool";
}

struct TimingSpan {
    std::string name;
    SpanKind kind = SpanKind::Llm;
    uint64_t start_offset_ms = 0;
    uint64_t duration_ms = 0;
};

struct ToolTiming {
    std::string name;
    uint64_t duration_ms = 0;
    bool has_error = false;
};

struct TimingSummary {
    uint64_t total_ms = 0;
    uint32_t turns = 0;
    uint32_t tool_calls = 0;
    std::vector<TimingSpan> spans;
    std::vector<ToolTiming> tool_details;
};

inline nlohmann::json to_json(const TimingSpan& s) {
    return {{"name", s.name}, {"type", span_kind_to_string(s.kind)},
            {"start_ms", s.start_offset_ms}, {"duration_ms", s.duration_ms}};
}

inline nlohmann::json to_json(const ToolTiming& t) {
    return {{"name", t.name}, {"duration_ms", t.duration_ms}, {"has_error", t.has_error}};
}

inline nlohmann::json to_json(const TimingSummary& t) {
    auto spans = nlohmann::json::array();
    for (const auto& s : t.spans) spans.push_back(to_json(s));
    auto details = nlohmann::json::array();
    for (const auto& d : t.tool_details) details.push_back(to_json(d));
    return {{"total_ms", t.total_ms}, {"turns", t.turns}, {"tool_calls", t.tool_calls},
            {"spans", std::move(spans)}, {"tool_details", std::move(details)}};
}

} // namespace sandlot
