#include "services/EventStream.hpp"

auto RequestChannel::publish(ShredEvent event) -> bool {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return false;
        }
        events_.push_back(std::move(event));
    }
    changed_.notify_all();
    return true;
}

void RequestChannel::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    changed_.notify_all();
}

auto RequestChannel::get(size_t index) const -> std::optional<ShredEvent> {
    std::unique_lock lock(mutex_);
    changed_.wait(lock, [&] { return index < events_.size() || closed_; });
    if (index < events_.size()) {
        return events_[index];
    }
    return std::nullopt;
}

auto RequestChannel::try_get(size_t index) const -> std::optional<ShredEvent> {
    std::lock_guard lock(mutex_);
    if (index < events_.size()) {
        return events_[index];
    }
    return std::nullopt;
}

void RequestChannel::wait_closed() const {
    std::unique_lock lock(mutex_);
    changed_.wait(lock, [&] { return closed_; });
}

auto RequestChannel::is_closed() const -> bool {
    std::lock_guard lock(mutex_);
    return closed_;
}

auto RequestChannel::size() const -> size_t {
    std::lock_guard lock(mutex_);
    return events_.size();
}

EventStream::EventStream(std::shared_ptr<const RequestChannel> channel)
    : channel_(std::move(channel)) {}

auto EventStream::next() -> std::optional<ShredEvent> {
    auto event = channel_->get(cursor_);
    if (event) {
        ++cursor_;
    }
    return event;
}

auto EventStream::poll() -> std::optional<ShredEvent> {
    auto event = channel_->try_get(cursor_);
    if (event) {
        ++cursor_;
    }
    return event;
}

auto EventStream::finished() const -> bool {
    return channel_->is_closed() && cursor_ >= channel_->size();
}

auto EventStream::collect() -> std::vector<ShredEvent> {
    std::vector<ShredEvent> events;
    while (auto event = next()) {
        events.push_back(std::move(*event));
    }
    return events;
}
