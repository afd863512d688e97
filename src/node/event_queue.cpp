/*
 * PeerLink - event queue implementation
 */

#include "event_queue.hpp"

#include <algorithm>
#include <utility>

namespace peerlink {

namespace {

bool is_chunk(const SessionEvent& event) {
    const auto* received = std::get_if<events::MessageReceived>(&event);
    return received && received->envelope.type == MessageType::FileChunk;
}

} // namespace

EventQueue::EventQueue(std::size_t max_queued_chunks)
    : max_queued_chunks_(std::max<std::size_t>(max_queued_chunks, 1)) {}

bool EventQueue::push(SessionEvent event) {
    const bool chunk = is_chunk(event);
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (chunk) {
            space_cv_.wait(lock, [this] { return closed_ || queued_chunks_ < max_queued_chunks_; });
        }
        if (closed_) {
            return false;
        }
        if (chunk) {
            ++queued_chunks_;
        }
        events_.push_back(std::move(event));
    }
    ready_cv_.notify_one();
    return true;
}

std::optional<SessionEvent> EventQueue::pop(std::chrono::steady_clock::time_point deadline) {
    std::optional<SessionEvent> event;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_cv_.wait_until(lock, deadline, [this] { return closed_ || woken_ || !events_.empty(); });
        woken_ = false;
        if (closed_ || events_.empty()) {
            return std::nullopt;
        }
        event = std::move(events_.front());
        events_.pop_front();
        if (!is_chunk(*event)) {
            return event;
        }
        --queued_chunks_;
    }
    space_cv_.notify_one();
    return event;
}

void EventQueue::wake() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        woken_ = true;
    }
    ready_cv_.notify_all();
}

void EventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        events_.clear();
        queued_chunks_ = 0;
    }
    ready_cv_.notify_all();
    space_cv_.notify_all();
}

bool EventQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

std::size_t EventQueue::queued_chunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queued_chunks_;
}

} // namespace peerlink
