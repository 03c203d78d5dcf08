#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>

#include "network_types.hpp"

namespace cadence::network {

/**
 * Bounded consumer-facing queue of StateChange records.
 *
 * When full, push() waits up to push_timeout for room; if the queue is
 * still full it drops the oldest record to admit the new one. close()
 * discards pending records and releases every waiting consumer.
 */
class EventStream {
public:
    enum class PushResult {
        ACCEPTED,
        DROPPED_OLDEST,
        CLOSED
    };

    explicit EventStream(size_t capacity,
                         std::chrono::milliseconds push_timeout = std::chrono::milliseconds(50));

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    PushResult push(StateChange change);

    // Blocks until a record arrives; empty once the stream is closed
    std::optional<StateChange> recv();
    std::optional<StateChange> recv_timeout(std::chrono::milliseconds timeout);
    std::optional<StateChange> try_recv();

    void close();
    bool is_closed() const { return closed_.load(); }

    size_t size() const;
    size_t capacity() const { return capacity_; }
    uint64_t dropped_count() const { return dropped_.load(); }
    uint64_t pushed_count() const { return pushed_.load(); }

    // Blocking iteration; ends when the stream is closed
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = StateChange;
        using difference_type = std::ptrdiff_t;
        using pointer = const StateChange*;
        using reference = const StateChange&;

        Iterator() = default;
        explicit Iterator(EventStream* stream);

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        Iterator& operator++();

        bool operator==(const Iterator& other) const { return stream_ == other.stream_; }
        bool operator!=(const Iterator& other) const { return !(*this == other); }

    private:
        EventStream* stream_ = nullptr;
        std::optional<StateChange> current_;
    };

    Iterator begin() { return Iterator(this); }
    Iterator end() { return Iterator(); }

private:
    std::optional<StateChange> pop_locked();

    const size_t capacity_;
    const std::chrono::milliseconds push_timeout_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<StateChange> queue_;

    std::atomic<bool> closed_{false};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> pushed_{0};
};

} // namespace cadence::network
