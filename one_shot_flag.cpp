#include <mutex>
#include <chrono>

#include "one_shot_flag.h"

namespace tunnel
{

bool one_shot_flag::close()
{
    {
        const std::lock_guard<std::mutex> lock(mutex_);
        if (closed_.load(std::memory_order_relaxed))
        {
            return false;
        }
        closed_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
    return true;
}

void one_shot_flag::wait()
{
    if (is_closed())
    {
        return;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_.load(std::memory_order_acquire); });
}

bool one_shot_flag::wait_for(const std::chrono::steady_clock::duration timeout)
{
    if (is_closed())
    {
        return true;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return closed_.load(std::memory_order_acquire); });
}

}    // namespace tunnel
