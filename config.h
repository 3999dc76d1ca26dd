#ifndef CONFIG_H
#define CONFIG_H

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <expected>

#include "tcp_conn.h"
#include "split_retry_conn.h"

namespace tunnel
{

struct config
{
    struct log_t
    {
        std::string level = "info";
        std::string file = "tunnel_probe.log";
    } log;

    struct destination_t
    {
        std::string host = "127.0.0.1";
        std::uint16_t port = 443;
    } destination;

    struct dial_t
    {
        std::uint32_t connect_timeout_ms = 5000;
        std::uint32_t mark = 0;
        bool no_delay = true;
    } dial;

    struct retry_t
    {
        std::uint32_t timeout_base_ms = 1200;
        std::uint32_t rtt_multiplier = 2;
        std::uint32_t min_split = 32;
        std::uint32_t max_split = 64;
        std::uint32_t read_from_chunk = 2048;
    } retry;

    struct probe_t
    {
        // Empty sends a plain HTTP HEAD request.
        std::string payload_hex;
        std::uint32_t read_size = 4096;
    } probe;
};

struct config_error
{
    std::string path = "/";
    std::string reason;
};

[[nodiscard]] std::expected<config, config_error> parse_config_with_error(const std::string& filename);
[[nodiscard]] std::expected<config, config_error> parse_config_text(const std::string& text);
[[nodiscard]] std::optional<config> parse_config(const std::string& filename);
[[nodiscard]] std::string dump_config(const config& cfg);
[[nodiscard]] std::string dump_default_config();

[[nodiscard]] tcp_conn_options make_dial_options(const config& cfg);
[[nodiscard]] split_retry_options make_retry_options(const config& cfg);
[[nodiscard]] std::expected<std::vector<std::uint8_t>, config_error> decode_probe_payload(const config& cfg);

}    // namespace tunnel

#endif
