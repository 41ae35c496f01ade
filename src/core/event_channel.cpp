/**
 * @file event_channel.cpp
 * @brief Implementation of event_channel
 */

#include "kcenon/batch_transfer/core/event_channel.h"

#include <utility>

namespace kcenon::batch_transfer {

namespace {

auto is_tick(const batch_event& event) -> bool {
    return std::holds_alternative<countdown_tick>(event);
}

}  // namespace

void event_channel::push(batch_event event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (is_tick(event) && !queue_.empty() && is_tick(queue_.back())) {
            queue_.back() = std::move(event);
            ++coalesced_;
            return;
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
}

auto event_channel::pop(std::chrono::milliseconds timeout) -> std::optional<batch_event> {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; })) {
        return std::nullopt;
    }
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

auto event_channel::try_pop() -> std::optional<batch_event> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

auto event_channel::drain() -> std::vector<batch_event> {
    std::deque<batch_event> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(queue_);
    }

    std::size_t last_tick = pending.size();
    for (std::size_t i = 0; i < pending.size(); ++i) {
        if (is_tick(pending[i])) {
            last_tick = i;
        }
    }

    std::vector<batch_event> events;
    events.reserve(pending.size());
    std::size_t dropped = 0;
    for (std::size_t i = 0; i < pending.size(); ++i) {
        if (is_tick(pending[i]) && i != last_tick) {
            ++dropped;
            continue;
        }
        events.push_back(std::move(pending[i]));
    }

    if (dropped > 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        coalesced_ += dropped;
    }
    return events;
}

void event_channel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

auto event_channel::is_closed() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

auto event_channel::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

auto event_channel::coalesced_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return coalesced_;
}

}  // namespace kcenon::batch_transfer
