#include <atomic>
#include <chrono>
#include <random>
#include <string>
#include <cstdint>
#include <cstdio>
#include <charconv>
#include <utility>
#include <system_error>

#include "log_context.h"

namespace tunnel
{

namespace
{

template <typename IntT>
void append_int(std::string& out, const IntT value)
{
    char buf[32];
    const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec == std::errc())
    {
        out.append(buf, ptr);
    }
}

std::string fixed_hex_16(const std::uint64_t value)
{
    char buf[16];
    const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value, 16);
    if (ec != std::errc())
    {
        return "0000000000000000";
    }

    const auto len = static_cast<std::size_t>(ptr - buf);
    std::string out;
    out.reserve(16);
    out.append(16 - len, '0');
    out.append(buf, len);
    return out;
}

std::string format_scaled(const double value, const char* unit)
{
    char buf[32];
    const int n = std::snprintf(buf, sizeof(buf), "%.2f%s", value, unit);
    if (n <= 0)
    {
        return {};
    }
    return std::string(buf, static_cast<std::size_t>(n));
}

}    // namespace

std::string generate_trace_id()
{
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<std::uint64_t> dist;
    return fixed_hex_16(dist(gen));
}

std::uint32_t next_stream_id()
{
    static std::atomic<std::uint32_t> next_id{1};
    return next_id.fetch_add(1, std::memory_order_relaxed);
}

std::string stream_context::prefix() const
{
    std::string out;
    out.reserve(trace_id.size() + destination.size() + 16);
    if (!trace_id.empty())
    {
        out.push_back('t');
        out.append(trace_id);
        out.push_back(' ');
    }
    out.push_back('s');
    append_int(out, stream_id);
    if (!destination.empty())
    {
        out.push_back(' ');
        out.append(destination);
    }
    return out;
}

std::int64_t stream_context::elapsed_ms() const
{
    const auto elapsed = std::chrono::steady_clock::now() - start_time;
    return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
}

stream_context stream_context::make(std::string destination)
{
    stream_context ctx;
    ctx.trace_id = generate_trace_id();
    ctx.stream_id = next_stream_id();
    ctx.destination = std::move(destination);
    return ctx;
}

std::string format_bytes(const std::uint64_t bytes)
{
    constexpr std::uint64_t kKiB = 1024;
    constexpr std::uint64_t kMiB = kKiB * 1024;
    constexpr std::uint64_t kGiB = kMiB * 1024;
    if (bytes >= kGiB)
    {
        return format_scaled(static_cast<double>(bytes) / static_cast<double>(kGiB), "GB");
    }
    if (bytes >= kMiB)
    {
        return format_scaled(static_cast<double>(bytes) / static_cast<double>(kMiB), "MB");
    }
    if (bytes >= kKiB)
    {
        return format_scaled(static_cast<double>(bytes) / static_cast<double>(kKiB), "KB");
    }
    std::string out;
    append_int(out, bytes);
    out.push_back('B');
    return out;
}

std::string format_latency_ms(const std::int64_t ms)
{
    std::string out;
    append_int(out, ms);
    out.append("ms");
    return out;
}

}    // namespace tunnel
