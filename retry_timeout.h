#ifndef RETRY_TIMEOUT_H
#define RETRY_TIMEOUT_H

#include <chrono>
#include <cstdint>

namespace tunnel
{

// Given the time the SYN was sent and the time the SYN-ACK arrived, bounds how
// long the first reply to a hello may take before the stream retries. The
// defaults keep false positive retries under 1% while still retrying a
// stalled connection quickly; the reply needs one more round trip than the
// handshake did, hence the doubled RTT.
struct retry_timeout_policy
{
    std::chrono::milliseconds base{1200};
    std::uint32_t rtt_multiplier = 2;

    [[nodiscard]] std::chrono::steady_clock::duration estimate(const std::chrono::steady_clock::time_point before,
                                                               const std::chrono::steady_clock::time_point after) const
    {
        auto rtt = after - before;
        if (rtt < std::chrono::steady_clock::duration::zero())
        {
            rtt = std::chrono::steady_clock::duration::zero();
        }
        return std::chrono::duration_cast<std::chrono::steady_clock::duration>(base) + rtt * rtt_multiplier;
    }
};

[[nodiscard]] inline std::chrono::steady_clock::duration retry_timeout(const std::chrono::steady_clock::time_point before,
                                                                       const std::chrono::steady_clock::time_point after)
{
    return retry_timeout_policy{}.estimate(before, after);
}

}    // namespace tunnel

#endif
