#include "orchestrator.hpp"
#include "prompt.hpp"
#include "tools/execute_code.hpp"
#include "tools/load_result.hpp"
#include "util.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

namespace sandlot {

static nlohmann::json optional_json(const std::optional<std::string>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

nlohmann::json artifact_event_payload(const Artifact& artifact) {
    return {
        {"id", artifact.id},
        {"code", artifact.code},
        {"result_json", optional_json(artifact.result_json)},
        {"result_type", optional_json(artifact.result_type)},
        {"error", optional_json(artifact.error)}
    };
}

// ── Orchestrator ────────────────────────────────────────────────

Orchestrator::Orchestrator(ConversationStore& store, ExecutionBridge& bridge,
                           AgentRunner& agent, std::string schema_context,
                           uint32_t max_load_rows)
    : store_(store)
    , bridge_(bridge)
    , agent_(agent)
    , schema_context_(std::move(schema_context))
    , max_load_rows_(max_load_rows)
{}

std::string Orchestrator::begin_turn(const std::optional<std::string>& conversation_id,
                                     const std::string& message) {
    std::string id;
    if (conversation_id && !conversation_id->empty()) {
        id = *conversation_id;
    } else {
        id = store_.create_conversation().id;
    }
    store_.add_message(id, "user", message);
    return id;
}

ChatStream Orchestrator::stream(const std::string& conversation_id,
                                const std::string& user_message) {
    auto ctx = std::make_unique<RequestContext>();
    ctx->conversation_id = conversation_id;
    ctx->user_message = user_message;
    ctx->started_ms = monotonic_ms();
    ctx->last_span_ms = ctx->started_ms;
    return ChatStream(*this, std::move(ctx));
}

std::optional<ExecutionOutcome> Orchestrator::replay_artifact(const std::string& artifact_id) {
    auto artifact = store_.get_artifact(artifact_id);
    if (!artifact) return std::nullopt;
    return bridge_.run(artifact->code);
}

void Orchestrator::on_agent_message(RequestContext& ctx, const AgentMessage& message) {
    uint64_t now = monotonic_ms();
    TimingSpan span;
    span.start_offset_ms = ctx.last_span_ms - ctx.started_ms;
    span.duration_ms = now - ctx.last_span_ms;
    ctx.last_span_ms = now;

    if (message.kind == AgentMessageKind::AssistantTurn) {
        ctx.turns++;
        span.name = "LLM Turn " + std::to_string(ctx.turns);
        span.kind = SpanKind::Llm;
        ctx.spans.push_back(span);

        for (const auto& text : message.text_blocks) {
            if (trim(text).empty()) continue;
            ctx.queue.push(StreamEventKind::Text, text);
            ctx.reply += text;
        }
        for (const auto& call : message.tool_calls) {
            ctx.tool_calls++;
            if (call.name == "execute_code") {
                auto args = nlohmann::json::parse(call.arguments, nullptr, false);
                std::string code;
                if (args.is_object() && args.contains("code") && args["code"].is_string()) {
                    code = args["code"].get<std::string>();
                }
                ctx.queue.push(StreamEventKind::Code, code);
            } else if (call.name == "load_result") {
                ctx.queue.push(StreamEventKind::Status, "Loading result data...");
            }
        }
    } else {
        span.name = "Tool Execution";
        span.kind = SpanKind::Tool;
        ctx.spans.push_back(span);
        ctx.queue.push(StreamEventKind::Status, "Analyzing results...");
    }
}

void Orchestrator::run_agent(RequestContext& ctx) {
    try {
        auto history = store_.get_messages(ctx.conversation_id);
        AgentRequest request;
        request.system_prompt = build_system_prompt(schema_context_);
        request.prompt = build_prompt_with_history(ctx.user_message, history);

        std::vector<std::unique_ptr<Tool>> tools;
        tools.push_back(std::make_unique<ExecuteCodeTool>(bridge_, store_, ctx));
        tools.push_back(std::make_unique<LoadResultTool>(store_, max_load_rows_));

        ctx.queue.push(StreamEventKind::Status, "Agent is thinking...");
        agent_.run(request, tools, [this, &ctx](const AgentMessage& message) {
            on_agent_message(ctx, message);
        });
    } catch (const std::exception& e) {
        std::cerr << "[orchestrator] Error in agent run: " << e.what() << "\n";
        ctx.queue.push(StreamEventKind::Error, e.what());
    }
    ctx.queue.close();
}

// ── ChatStream ──────────────────────────────────────────────────

ChatStream::ChatStream(Orchestrator& owner, std::unique_ptr<RequestContext> ctx)
    : owner_(&owner), ctx_(std::move(ctx)) {}

ChatStream::~ChatStream() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

void ChatStream::launch() {
    RequestContext* ctx = ctx_.get();
    Orchestrator* owner = owner_;
    worker_ = std::thread([owner, ctx]() { owner->run_agent(*ctx); });
}

void ChatStream::finalize() {
    RequestContext& ctx = *ctx_;

    try {
        if (!trim(ctx.reply).empty()) {
            owner_->store_.add_message(ctx.conversation_id, "assistant", ctx.reply);
        }
        auto conv = owner_->store_.get_conversation(ctx.conversation_id);
        if (conv && conv->title == DEFAULT_CONVERSATION_TITLE) {
            owner_->store_.update_conversation_title(ctx.conversation_id,
                                                     conversation_title(ctx.user_message));
        }
    } catch (const std::exception& e) {
        std::cerr << "[orchestrator] Failed to persist turn: " << e.what() << "\n";
        tail_.push_back(StreamEvent{StreamEventKind::Error, e.what()});
    }

    auto ids = nlohmann::json::array();
    for (const auto& artifact : ctx.pending_artifacts) {
        tail_.push_back(StreamEvent{StreamEventKind::Artifact,
                                    artifact_event_payload(artifact).dump()});
        ids.push_back(artifact.id);
    }

    TimingSummary timing;
    timing.total_ms = monotonic_ms() - ctx.started_ms;
    timing.turns = ctx.turns;
    timing.tool_calls = ctx.tool_calls;
    timing.spans = ctx.spans;
    timing.tool_details = ctx.tool_timings;
    // Close the timeline: the last span runs to the end of the turn
    if (timing.spans.empty()) {
        // Agent produced no message; the whole turn was spent waiting on it
        TimingSpan span;
        span.name = "LLM Turn " + std::to_string(ctx.turns + 1);
        span.kind = SpanKind::Llm;
        span.start_offset_ms = ctx.last_span_ms - ctx.started_ms;
        if (timing.total_ms < span.start_offset_ms) {
            timing.total_ms = span.start_offset_ms;
        }
        span.duration_ms = timing.total_ms - span.start_offset_ms;
        timing.spans.push_back(span);
    } else {
        auto& last = timing.spans.back();
        if (timing.total_ms < last.start_offset_ms) {
            timing.total_ms = last.start_offset_ms;
        }
        last.duration_ms = timing.total_ms - last.start_offset_ms;
    }

    nlohmann::json done = {{"artifacts", ids}, {"timing", to_json(timing)}};
    tail_.push_back(StreamEvent{StreamEventKind::Done, done.dump()});
}

bool ChatStream::next(StreamEvent& event) {
    switch (phase_) {
        case Phase::Start:
            phase_ = Phase::Streaming;
            event = StreamEvent{StreamEventKind::Status, "Starting analysis..."};
            return true;

        case Phase::Streaming:
            if (!worker_.joinable()) {
                launch();
            }
            if (auto item = ctx_->queue.pop()) {
                event = std::move(*item);
                return true;
            }
            worker_.join();
            finalize();
            phase_ = Phase::Tail;
            return next(event);

        case Phase::Tail:
            if (tail_.empty()) {
                phase_ = Phase::Finished;
                return false;
            }
            event = std::move(tail_.front());
            tail_.pop_front();
            if (tail_.empty()) phase_ = Phase::Finished;
            return true;

        case Phase::Finished:
            return false;
    }
    return false;
}

} // namespace sandlot
