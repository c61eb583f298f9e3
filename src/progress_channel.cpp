#include "filechunker/progress_channel.hpp"

#include <utility>

namespace filechunker
{

ProgressChannel::ProgressChannel(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity)
{
}

void ProgressChannel::push(ProgressEvent event)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
        {
            return;
        }
        if (events_.size() >= capacity_)
        {
            events_.pop_front();
            ++dropped_;
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<ProgressEvent> ProgressChannel::tryPop()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty())
    {
        return std::nullopt;
    }
    ProgressEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<ProgressEvent> ProgressChannel::waitPop(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [&] { return closed_ || !events_.empty(); });
    if (events_.empty())
    {
        return std::nullopt;
    }
    ProgressEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::vector<ProgressEvent> ProgressChannel::drain()
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProgressEvent> out(std::make_move_iterator(events_.begin()),
                                   std::make_move_iterator(events_.end()));
    events_.clear();
    return out;
}

void ProgressChannel::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
    dropped_ = 0;
    closed_ = false;
}

void ProgressChannel::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ProgressChannel::closed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t ProgressChannel::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

std::size_t ProgressChannel::dropped() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace filechunker
