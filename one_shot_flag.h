#ifndef ONE_SHOT_FLAG_H
#define ONE_SHOT_FLAG_H

#include <atomic>
#include <chrono>
#include <mutex>
#include <condition_variable>

namespace tunnel
{

// Starts open and moves to closed exactly once. close() is a release
// operation and is_closed() an acquire, so anything written before close()
// is visible to a thread that observes is_closed() == true or returns from
// wait().
class one_shot_flag
{
   public:
    one_shot_flag() = default;
    one_shot_flag(const one_shot_flag&) = delete;
    one_shot_flag& operator=(const one_shot_flag&) = delete;

    // Returns true for the call that performed the transition.
    bool close();

    [[nodiscard]] bool is_closed() const noexcept { return closed_.load(std::memory_order_acquire); }

    void wait();

    [[nodiscard]] bool wait_for(std::chrono::steady_clock::duration timeout);

   private:
    std::atomic<bool> closed_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

}    // namespace tunnel

#endif
