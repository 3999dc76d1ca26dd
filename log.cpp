#include "log.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <cstdlib>

#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tunnel
{

namespace
{

struct level_alias
{
    const char* name;
    spdlog::level::level_enum value;
};

constexpr level_alias kLevels[] = {
    {.name = "trace", .value = spdlog::level::trace},
    {.name = "debug", .value = spdlog::level::debug},
    {.name = "info", .value = spdlog::level::info},
    {.name = "warn", .value = spdlog::level::warn},
    {.name = "warning", .value = spdlog::level::warn},
    {.name = "err", .value = spdlog::level::err},
    {.name = "error", .value = spdlog::level::err},
    {.name = "critical", .value = spdlog::level::critical},
    {.name = "off", .value = spdlog::level::off},
};

std::uint32_t env_or_default(const char* name, const std::uint32_t fallback)
{
    const char* value = std::getenv(name);
    if (value == nullptr)
    {
        return fallback;
    }
    const long parsed = std::strtol(value, nullptr, 10);
    if (parsed <= 0)
    {
        return fallback;
    }
    return static_cast<std::uint32_t>(parsed);
}

spdlog::level::level_enum parse_level_name(const std::string& level)
{
    for (const auto& entry : kLevels)
    {
        if (level == entry.name)
        {
            return entry.value;
        }
    }
    return spdlog::level::info;
}

spdlog::level::level_enum level_from_env()
{
    if (std::getenv("TRACE") != nullptr)
    {
        return spdlog::level::trace;
    }
    if (std::getenv("DEBUG") != nullptr)
    {
        return spdlog::level::debug;
    }
    return spdlog::level::info;
}

}    // namespace

void init_log(const std::string& filename)
{
    constexpr std::uint32_t kFileSize = 20 * 1024 * 1024;
    constexpr std::uint32_t kFileCount = 3;

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!filename.empty())
    {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            filename, env_or_default("kLogFileSize", kFileSize), env_or_default("kLogFileCount", kFileCount)));
    }
    auto logger = std::make_shared<spdlog::logger>("", begin(sinks), end(sinks));
    spdlog::set_default_logger(logger);
    spdlog::flush_every(std::chrono::seconds(3));
    spdlog::set_pattern("%Y%m%d %T.%f %t %L %v %s:%#");
    spdlog::set_level(level_from_env());
}

void set_level(const std::string& level) { spdlog::set_level(parse_level_name(level)); }

std::string current_level()
{
    const auto name = spdlog::level::to_string_view(spdlog::get_level());
    return std::string(name.data(), name.size());
}

void shutdown_log()
{
    spdlog::default_logger()->flush();
    spdlog::shutdown();
}

}    // namespace tunnel
