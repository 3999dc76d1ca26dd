#ifndef LOG_CONTEXT_H
#define LOG_CONTEXT_H

#include <chrono>
#include <string>
#include <cstdint>

namespace tunnel
{

namespace log_event
{
constexpr const char* kDial = "dial";
constexpr const char* kRetry = "retry";
constexpr const char* kSplit = "split";
constexpr const char* kHalfClose = "half_close";
constexpr const char* kDeadline = "deadline";
constexpr const char* kProbe = "probe";
}    // namespace log_event

[[nodiscard]] std::string generate_trace_id();

// Process-wide, starts at 1.
[[nodiscard]] std::uint32_t next_stream_id();

struct stream_context
{
    std::string trace_id;
    std::uint32_t stream_id = 0;
    std::string destination;
    std::chrono::steady_clock::time_point start_time = std::chrono::steady_clock::now();

    [[nodiscard]] std::string prefix() const;

    [[nodiscard]] std::int64_t elapsed_ms() const;

    [[nodiscard]] static stream_context make(std::string destination);
};

[[nodiscard]] std::string format_bytes(std::uint64_t bytes);

[[nodiscard]] std::string format_latency_ms(std::int64_t ms);

}    // namespace tunnel

#endif
