#ifndef STATISTICS_H
#define STATISTICS_H

#include <atomic>
#include <chrono>
#include <cstdint>

namespace tunnel
{

class statistics
{
   public:
    static statistics& instance()
    {
        static statistics s;
        return s;
    }

    void start_time() { start_time_ = std::chrono::steady_clock::now(); }

    std::uint64_t uptime_seconds() const
    {
        const auto now = std::chrono::steady_clock::now();
        const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - start_time_).count();
        if (uptime <= 0)
        {
            return 0;
        }
        return static_cast<std::uint64_t>(uptime);
    }

    void inc_dials() { dials_++; }
    std::uint64_t dials() const { return dials_.load(); }

    void inc_dial_failures() { dial_failures_++; }
    std::uint64_t dial_failures() const { return dial_failures_.load(); }

    void inc_retries() { retries_++; }
    std::uint64_t retries() const { return retries_.load(); }

    void inc_retry_dial_failures() { retry_dial_failures_++; }
    std::uint64_t retry_dial_failures() const { return retry_dial_failures_.load(); }

    void inc_retry_write_failures() { retry_write_failures_++; }
    std::uint64_t retry_write_failures() const { return retry_write_failures_.load(); }

    // The first read after a retry returned data.
    void inc_retries_recovered() { retries_recovered_++; }
    std::uint64_t retries_recovered() const { return retries_recovered_.load(); }

    void add_bytes_replayed(std::uint64_t n) { bytes_replayed_ += n; }
    std::uint64_t bytes_replayed() const { return bytes_replayed_.load(); }

    void reset()
    {
        dials_ = 0;
        dial_failures_ = 0;
        retries_ = 0;
        retry_dial_failures_ = 0;
        retry_write_failures_ = 0;
        retries_recovered_ = 0;
        bytes_replayed_ = 0;
    }

   private:
    std::atomic<std::uint64_t> dials_{0};
    std::atomic<std::uint64_t> dial_failures_{0};
    std::atomic<std::uint64_t> retries_{0};
    std::atomic<std::uint64_t> retry_dial_failures_{0};
    std::atomic<std::uint64_t> retry_write_failures_{0};
    std::atomic<std::uint64_t> retries_recovered_{0};
    std::atomic<std::uint64_t> bytes_replayed_{0};

   private:
    statistics() = default;
    ~statistics() = default;
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
};

}    // namespace tunnel

#endif
