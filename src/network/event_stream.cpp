#include "network/event_stream.hpp"
#include "utils/logger.hpp"

#include <stdexcept>

namespace cadence::network {

EventStream::EventStream(size_t capacity, std::chrono::milliseconds push_timeout)
    : capacity_(capacity), push_timeout_(push_timeout) {
    if (capacity_ == 0) {
        throw std::invalid_argument("EventStream: capacity must be at least 1");
    }
}

EventStream::PushResult EventStream::push(StateChange change) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_.load()) {
        return PushResult::CLOSED;
    }

    PushResult result = PushResult::ACCEPTED;
    if (queue_.size() >= capacity_) {
        bool room = push_timeout_.count() > 0 &&
                    not_full_.wait_for(lock, push_timeout_, [this] {
                        return closed_.load() || queue_.size() < capacity_;
                    });
        if (closed_.load()) {
            return PushResult::CLOSED;
        }
        if (!room) {
            queue_.pop_front();
            dropped_.fetch_add(1);
            result = PushResult::DROPPED_OLDEST;
        }
    }

    queue_.push_back(std::move(change));
    pushed_.fetch_add(1);
    lock.unlock();
    not_empty_.notify_one();

    if (result == PushResult::DROPPED_OLDEST) {
        Logger::debug("EventStream: full at {} records, dropped oldest", capacity_);
    }
    return result;
}

std::optional<StateChange> EventStream::recv() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return closed_.load() || !queue_.empty(); });
    return pop_locked();
}

std::optional<StateChange> EventStream::recv_timeout(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait_for(lock, timeout, [this] { return closed_.load() || !queue_.empty(); });
    return pop_locked();
}

std::optional<StateChange> EventStream::try_recv() {
    std::unique_lock<std::mutex> lock(mutex_);
    return pop_locked();
}

// Caller holds mutex_.
std::optional<StateChange> EventStream::pop_locked() {
    if (closed_.load() || queue_.empty()) {
        return std::nullopt;
    }
    StateChange change = std::move(queue_.front());
    queue_.pop_front();
    not_full_.notify_one();
    return change;
}

void EventStream::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_.exchange(true)) {
            return;
        }
        queue_.clear();
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    Logger::debug("EventStream: closed");
}

size_t EventStream::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

EventStream::Iterator::Iterator(EventStream* stream) : stream_(stream) {
    ++(*this);
}

EventStream::Iterator& EventStream::Iterator::operator++() {
    if (!stream_) {
        return *this;
    }
    current_ = stream_->recv();
    if (!current_) {
        stream_ = nullptr;
    }
    return *this;
}

} // namespace cadence::network
