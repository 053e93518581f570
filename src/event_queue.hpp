#pragma once
#include "event.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace sandlot {

// Blocking queue between the agent thread (producer) and the stream
// consumer. close() is the end-of-stream sentinel: pop() drains what is
// queued, then returns nullopt.
class EventQueue {
public:
    void push(StreamEventKind kind, std::string payload) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            items_.push_back(StreamEvent{kind, std::move(payload)});
        }
        cv_.notify_one();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    std::optional<StreamEvent> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !items_.empty() || closed_; });
        if (items_.empty()) return std::nullopt;
        StreamEvent ev = std::move(items_.front());
        items_.pop_front();
        return ev;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<StreamEvent> items_;
    bool closed_ = false;
};

} // namespace sandlot
