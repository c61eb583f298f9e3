#pragma once

#include "export.hpp"
#include "file_splitter.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace filechunker {

/**
 * @brief Bounded single-producer/single-consumer queue of progress events.
 *
 * push() never blocks the producer: when the queue is full the oldest queued
 * event is discarded and counted. Events carry cumulative totals, so the most
 * recent state always survives. Delivery order matches push order.
 */
class FILECHUNKER_API ProgressChannel {
public:
    explicit ProgressChannel(std::size_t capacity = kDefaultCapacity);

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    void push(ProgressEvent event);

    std::optional<ProgressEvent> tryPop();

    // Waits up to timeout; returns nothing on timeout or once closed and empty
    std::optional<ProgressEvent> waitPop(std::chrono::milliseconds timeout);

    std::vector<ProgressEvent> drain();

    // Reopens an empty channel for a new run
    void reset();

    void close();
    bool closed() const;

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }
    std::size_t dropped() const;

    static constexpr std::size_t kDefaultCapacity = 1024;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> events_;
    std::size_t dropped_{0};
    bool closed_{false};
};

} // namespace filechunker
