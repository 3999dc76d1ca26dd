#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <cstdio>
#include <cstdint>
#include <cstring>
#include <utility>

#include <boost/asio/buffer.hpp>

#include "log.h"
#include "config.h"
#include "dialer.h"
#include "net_utils.h"
#include "statistics.h"
#include "log_context.h"
#include "memory_reader.h"
#include "split_retry_conn.h"

namespace
{

void print_usage(const char* prog)
{
    std::fputs("Usage:\n", stdout);
    std::fprintf(stdout, "%s -c <config>  Probe the configured destination with split retry\n", prog);
    std::fprintf(stdout, "%s config       Dump default configuration\n", prog);
}

int parse_config_from_file(const std::string& file, tunnel::config& cfg)
{
    const auto parsed = tunnel::parse_config_with_error(file);
    if (!parsed)
    {
        const auto& error = parsed.error();
        std::fprintf(stderr, "parse config failed path %s reason %s\n", error.path.c_str(), error.reason.c_str());
        return -1;
    }
    cfg = *parsed;
    return 0;
}

std::vector<std::uint8_t> default_probe_payload(const tunnel::config& cfg)
{
    const std::string request = "HEAD / HTTP/1.1\r\nHost: " + cfg.destination.host + "\r\nConnection: close\r\n\r\n";
    return std::vector<std::uint8_t>(request.begin(), request.end());
}

void log_statistics()
{
    const auto& stats = tunnel::statistics::instance();
    LOG_INFO("{} dials {} dial failures {} retries {} retry dial failures {} retry write failures {} recovered {} replayed {}",
             tunnel::log_event::kProbe,
             stats.dials(),
             stats.dial_failures(),
             stats.retries(),
             stats.retry_dial_failures(),
             stats.retry_write_failures(),
             stats.retries_recovered(),
             tunnel::format_bytes(stats.bytes_replayed()));
}

int run_probe(const tunnel::config& cfg)
{
    const auto destination = tunnel::net::make_tcp_endpoint(cfg.destination.host, cfg.destination.port);
    if (!destination)
    {
        LOG_ERROR("{} invalid destination {} error {}", tunnel::log_event::kProbe, cfg.destination.host, destination.error().message());
        return 1;
    }

    auto payload = tunnel::decode_probe_payload(cfg);
    if (!payload)
    {
        LOG_ERROR("{} invalid payload {}", tunnel::log_event::kProbe, payload.error().reason);
        return 1;
    }
    if (payload->empty())
    {
        *payload = default_probe_payload(cfg);
    }

    auto dialer = std::make_shared<tunnel::tcp_dialer>(tunnel::make_dial_options(cfg));
    auto stream = tunnel::dial_with_split_retry(dialer, *destination, tunnel::make_retry_options(cfg));
    if (!stream)
    {
        LOG_ERROR("{} dial {} failed {}", tunnel::log_event::kProbe, tunnel::net::endpoint_to_string(*destination), stream.error().message());
        log_statistics();
        return 1;
    }
    const auto conn = *stream;

    std::thread writer(
        [conn, bytes = std::move(*payload)]() mutable
        {
            tunnel::memory_reader reader(std::move(bytes));
            const auto copied = conn->read_from(reader);
            if (copied.ec)
            {
                LOG_CTX_WARN(conn->context(), "{} send failed after {} error {}", tunnel::log_event::kProbe, copied.size, copied.ec.message());
                return;
            }
            LOG_CTX_INFO(conn->context(), "{} sent {}", tunnel::log_event::kProbe, tunnel::format_bytes(copied.size));
        });

    std::vector<std::uint8_t> reply(cfg.probe.read_size);
    const auto result = conn->read(boost::asio::buffer(reply));
    writer.join();

    if (const auto ec = conn->close_write(); ec)
    {
        LOG_CTX_WARN(conn->context(), "{} close write failed {}", tunnel::log_event::kProbe, ec.message());
    }
    if (const auto ec = conn->close_read(); ec)
    {
        LOG_CTX_WARN(conn->context(), "{} close read failed {}", tunnel::log_event::kProbe, ec.message());
    }

    const int rc = result.size > 0 ? 0 : 1;
    if (rc == 0)
    {
        LOG_CTX_INFO(conn->context(),
                     "{} reply {} retried {} in {}",
                     tunnel::log_event::kProbe,
                     tunnel::format_bytes(result.size),
                     conn->retried(),
                     tunnel::format_latency_ms(conn->context().elapsed_ms()));
    }
    else
    {
        LOG_CTX_WARN(conn->context(), "{} no reply error {}", tunnel::log_event::kProbe, result.ec.message());
    }
    log_statistics();
    return rc;
}

int run_with_config(const char* prog, const char* config_path)
{
    tunnel::config cfg;
    if (parse_config_from_file(config_path, cfg) != 0)
    {
        print_usage(prog);
        return -1;
    }

    tunnel::init_log(cfg.log.file);
    tunnel::set_level(cfg.log.level);
    tunnel::statistics::instance().start_time();

    const int rc = run_probe(cfg);
    tunnel::shutdown_log();
    return rc;
}

}    // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        print_usage(argv[0]);
        return 1;
    }

    const char* mode = argv[1];
    if (std::strcmp(mode, "config") == 0)
    {
        const std::string default_config = tunnel::dump_default_config();
        std::fputs(default_config.c_str(), stdout);
        std::fputc('\n', stdout);
        return 0;
    }

    if (std::strcmp(mode, "-c") != 0 || argc <= 2)
    {
        print_usage(argv[0]);
        return -1;
    }
    return run_with_config(argv[0], argv[2]);
}
