/*
 * PeerLink - event queue between the node threads and the session
 *
 * File chunks count against a bound: a reader posting a chunk blocks while
 * the bound is reached, so a fast sender is held to the pace of the event
 * thread and memory stays proportional to the chunk size.
 */

#pragma once

#include "session.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace peerlink {

constexpr std::size_t kMaxQueuedChunks = 64;

class EventQueue {
public:
    explicit EventQueue(std::size_t max_queued_chunks = kMaxQueuedChunks);

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    // Blocks while the chunk bound is reached. False once the queue is closed;
    // the event is dropped.
    bool push(SessionEvent event);

    // Waits for an event until the deadline. nullopt on timeout, after wake()
    // and once closed.
    std::optional<SessionEvent> pop(std::chrono::steady_clock::time_point deadline);

    // Makes a waiting pop return early.
    void wake();

    // Releases every waiter. Queued events are discarded.
    void close();

    bool closed() const;
    std::size_t size() const;
    std::size_t queued_chunks() const;

private:
    const std::size_t max_queued_chunks_;
    mutable std::mutex mutex_;
    std::condition_variable ready_cv_;
    std::condition_variable space_cv_;
    std::deque<SessionEvent> events_;
    std::size_t queued_chunks_ = 0;
    bool woken_ = false;
    bool closed_ = false;
};

} // namespace peerlink
