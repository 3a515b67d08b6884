/**
 * @file EventStream.hpp
 * @brief Replayable per-request event log and its subscriber view
 */

#pragma once

#include "models/ShredTypes.hpp"

#include <condition_variable>
#include <cstddef>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

/**
 * @class RequestChannel
 * @brief Append-only event log of one request
 *
 * Every event ever published is retained so that each subscriber can
 * replay from the first one. Closed once every task of the request is
 * terminal; nothing is published after close().
 */
class RequestChannel {
public:
    /**
     * @return false if the channel is already closed
     */
    auto publish(ShredEvent event) -> bool;
    void close();

    /**
     * @brief Event at @p index, blocking until it exists or the channel closes
     * @return std::nullopt if the channel closed before @p index was published
     */
    [[nodiscard]] auto get(size_t index) const -> std::optional<ShredEvent>;

    /**
     * @brief Event at @p index if already published
     */
    [[nodiscard]] auto try_get(size_t index) const -> std::optional<ShredEvent>;

    void wait_closed() const;

    [[nodiscard]] auto is_closed() const -> bool;
    [[nodiscard]] auto size() const -> size_t;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable changed_;
    std::vector<ShredEvent> events_;
    bool closed_ = false;
};

/**
 * @class EventStream
 * @brief A subscriber's cursor over a RequestChannel
 *
 * Lazy: events are read as the caller advances. Iterating with a range-for
 * blocks until the request finishes.
 * @code
 * for (const auto& event : *service.subscribe(id)) {
 *     if (auto* result = std::get_if<OperationResult>(&event)) { ... }
 * }
 * @endcode
 */
class EventStream {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ShredEvent;
        using difference_type = std::ptrdiff_t;
        using pointer = const ShredEvent*;
        using reference = const ShredEvent&;

        iterator() = default;
        explicit iterator(EventStream* stream) : stream_(stream) { advance(); }

        auto operator*() const -> reference { return *current_; }
        auto operator->() const -> pointer { return &*current_; }

        auto operator++() -> iterator& {
            advance();
            return *this;
        }
        void operator++(int) { advance(); }

        friend auto operator==(const iterator& it, std::default_sentinel_t) -> bool {
            return !it.current_.has_value();
        }

    private:
        void advance() { current_ = stream_ != nullptr ? stream_->next() : std::nullopt; }

        EventStream* stream_ = nullptr;
        std::optional<ShredEvent> current_;
    };

    explicit EventStream(std::shared_ptr<const RequestChannel> channel);

    /**
     * @brief Next event, blocking; std::nullopt once the request finished
     */
    [[nodiscard]] auto next() -> std::optional<ShredEvent>;

    /**
     * @brief Next event if one is ready, without blocking
     */
    [[nodiscard]] auto poll() -> std::optional<ShredEvent>;

    /**
     * @brief True once the request finished and every event was consumed
     */
    [[nodiscard]] auto finished() const -> bool;

    /**
     * @brief Drain the remaining events, blocking until the request finishes
     */
    [[nodiscard]] auto collect() -> std::vector<ShredEvent>;

    auto begin() -> iterator { return iterator(this); }
    auto end() -> std::default_sentinel_t { return std::default_sentinel; }

private:
    std::shared_ptr<const RequestChannel> channel_;
    size_t cursor_ = 0;
};
