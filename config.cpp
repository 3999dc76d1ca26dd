#include <array>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <limits>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <cstring>
#include <utility>
#include <expected>
#include <optional>

#include <boost/asio/ip/address.hpp>
#include <openssl/crypto.h>

#include "config.h"
#include "split_hello.h"
#include "rapidjson/document.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/error/en.h"

namespace tunnel
{

namespace
{

constexpr std::uint32_t kMaxSplitBound = 4096;
constexpr std::uint32_t kMaxChunk = 1024 * 1024;
constexpr std::uint32_t kMaxRttMultiplier = 16;

[[nodiscard]] config_error make_config_error(std::string path, std::string reason)
{
    config_error error;
    error.path = std::move(path);
    error.reason = std::move(reason);
    return error;
}

// Returns nullptr when the member is absent, so the default stays in place.
[[nodiscard]] const rapidjson::Value* find_member(const rapidjson::Value& object, const char* name)
{
    const auto it = object.FindMember(name);
    if (it == object.MemberEnd() || it->value.IsNull())
    {
        return nullptr;
    }
    return &it->value;
}

[[nodiscard]] std::expected<const rapidjson::Value*, config_error> find_section(const rapidjson::Value& object, const char* name)
{
    const auto* member = find_member(object, name);
    if (member != nullptr && !member->IsObject())
    {
        return std::unexpected(make_config_error(std::string("/") + name, "must be an object"));
    }
    return member;
}

[[nodiscard]] std::expected<void, config_error> read_string(const rapidjson::Value& object, const char* name, const std::string& section, std::string& out)
{
    const std::string path = section + "/" + name;
    const auto* member = find_member(object, name);
    if (member == nullptr)
    {
        return {};
    }
    if (!member->IsString())
    {
        return std::unexpected(make_config_error(path, "must be a string"));
    }
    out.assign(member->GetString(), member->GetStringLength());
    return {};
}

[[nodiscard]] std::expected<void, config_error> read_bool(const rapidjson::Value& object, const char* name, const std::string& section, bool& out)
{
    const std::string path = section + "/" + name;
    const auto* member = find_member(object, name);
    if (member == nullptr)
    {
        return {};
    }
    if (!member->IsBool())
    {
        return std::unexpected(make_config_error(path, "must be a boolean"));
    }
    out = member->GetBool();
    return {};
}

template <typename T>
[[nodiscard]] std::expected<void, config_error> read_unsigned(const rapidjson::Value& object, const char* name, const std::string& section, T& out)
{
    const std::string path = section + "/" + name;
    const auto* member = find_member(object, name);
    if (member == nullptr)
    {
        return {};
    }
    if (!member->IsUint64() || member->GetUint64() > std::numeric_limits<T>::max())
    {
        return std::unexpected(make_config_error(path, "must be an unsigned integer in range"));
    }
    out = static_cast<T>(member->GetUint64());
    return {};
}

[[nodiscard]] std::expected<void, config_error> read_log_section(const rapidjson::Value& root, config::log_t& log)
{
    const auto section = find_section(root, "log");
    if (!section)
    {
        return std::unexpected(section.error());
    }
    if (*section == nullptr)
    {
        return {};
    }
    if (auto r = read_string(**section, "level", "/log", log.level); !r)
    {
        return r;
    }
    return read_string(**section, "file", "/log", log.file);
}

[[nodiscard]] std::expected<void, config_error> read_destination_section(const rapidjson::Value& root, config::destination_t& destination)
{
    const auto section = find_section(root, "destination");
    if (!section)
    {
        return std::unexpected(section.error());
    }
    if (*section == nullptr)
    {
        return {};
    }
    if (auto r = read_string(**section, "host", "/destination", destination.host); !r)
    {
        return r;
    }
    return read_unsigned(**section, "port", "/destination", destination.port);
}

[[nodiscard]] std::expected<void, config_error> read_dial_section(const rapidjson::Value& root, config::dial_t& dial)
{
    const auto section = find_section(root, "dial");
    if (!section)
    {
        return std::unexpected(section.error());
    }
    if (*section == nullptr)
    {
        return {};
    }
    if (auto r = read_unsigned(**section, "connect_timeout_ms", "/dial", dial.connect_timeout_ms); !r)
    {
        return r;
    }
    if (auto r = read_unsigned(**section, "mark", "/dial", dial.mark); !r)
    {
        return r;
    }
    return read_bool(**section, "no_delay", "/dial", dial.no_delay);
}

[[nodiscard]] std::expected<void, config_error> read_retry_section(const rapidjson::Value& root, config::retry_t& retry)
{
    const auto section = find_section(root, "retry");
    if (!section)
    {
        return std::unexpected(section.error());
    }
    if (*section == nullptr)
    {
        return {};
    }
    if (auto r = read_unsigned(**section, "timeout_base_ms", "/retry", retry.timeout_base_ms); !r)
    {
        return r;
    }
    if (auto r = read_unsigned(**section, "rtt_multiplier", "/retry", retry.rtt_multiplier); !r)
    {
        return r;
    }
    if (auto r = read_unsigned(**section, "min_split", "/retry", retry.min_split); !r)
    {
        return r;
    }
    if (auto r = read_unsigned(**section, "max_split", "/retry", retry.max_split); !r)
    {
        return r;
    }
    return read_unsigned(**section, "read_from_chunk", "/retry", retry.read_from_chunk);
}

[[nodiscard]] std::expected<void, config_error> read_probe_section(const rapidjson::Value& root, config::probe_t& probe)
{
    const auto section = find_section(root, "probe");
    if (!section)
    {
        return std::unexpected(section.error());
    }
    if (*section == nullptr)
    {
        return {};
    }
    if (auto r = read_string(**section, "payload_hex", "/probe", probe.payload_hex); !r)
    {
        return r;
    }
    return read_unsigned(**section, "read_size", "/probe", probe.read_size);
}

[[nodiscard]] bool is_known_log_level(const std::string& level)
{
    static constexpr std::array<const char*, 9> kLevels = {"trace", "debug", "info", "warn", "warning", "err", "error", "critical", "off"};
    for (const char* name : kLevels)
    {
        if (level == name)
        {
            return true;
        }
    }
    return false;
}

[[nodiscard]] std::expected<std::vector<std::uint8_t>, config_error> decode_hex_field(const std::string& hex, const std::string& path)
{
    if (hex.empty())
    {
        return std::vector<std::uint8_t>{};
    }
    if (hex.size() % 2 != 0)
    {
        return std::unexpected(make_config_error(path, "must be even-length hex when provided"));
    }
    long len = 0;
    std::uint8_t* buf = OPENSSL_hexstr2buf(hex.c_str(), &len);
    if (buf == nullptr)
    {
        return std::unexpected(make_config_error(path, "must be valid hex when provided"));
    }
    std::vector<std::uint8_t> bytes(buf, buf + len);
    OPENSSL_free(buf);
    return bytes;
}

[[nodiscard]] std::expected<void, config_error> validate_log_config(const config::log_t& log)
{
    if (!is_known_log_level(log.level))
    {
        return std::unexpected(make_config_error("/log/level", "must be trace, debug, info, warn, error, critical or off"));
    }
    return {};
}

[[nodiscard]] std::expected<void, config_error> validate_destination_config(const config::destination_t& destination)
{
    if (destination.host.empty())
    {
        return std::unexpected(make_config_error("/destination/host", "must be non-empty ip address"));
    }
    boost::system::error_code ec;
    (void)boost::asio::ip::make_address(destination.host, ec);
    if (ec)
    {
        return std::unexpected(make_config_error("/destination/host", "must be valid ip address"));
    }
    if (destination.port == 0)
    {
        return std::unexpected(make_config_error("/destination/port", "must be non-zero"));
    }
    return {};
}

[[nodiscard]] std::expected<void, config_error> validate_retry_config(const config::retry_t& retry)
{
    if (retry.timeout_base_ms == 0)
    {
        return std::unexpected(make_config_error("/retry/timeout_base_ms", "must be greater than 0"));
    }
    if (retry.rtt_multiplier > kMaxRttMultiplier)
    {
        return std::unexpected(make_config_error("/retry/rtt_multiplier", "must be at most 16"));
    }
    if (retry.min_split == 0)
    {
        return std::unexpected(make_config_error("/retry/min_split", "must be greater than 0"));
    }
    if (retry.min_split > retry.max_split)
    {
        return std::unexpected(make_config_error("/retry/min_split", "must be less than or equal to max_split"));
    }
    if (retry.max_split > kMaxSplitBound)
    {
        return std::unexpected(make_config_error("/retry/max_split", "must be at most 4096"));
    }
    if (retry.read_from_chunk == 0 || retry.read_from_chunk > kMaxChunk)
    {
        return std::unexpected(make_config_error("/retry/read_from_chunk", "must be between 1 and 1048576"));
    }
    return {};
}

[[nodiscard]] std::expected<void, config_error> validate_probe_config(const config::probe_t& probe)
{
    if (probe.read_size == 0 || probe.read_size > kMaxChunk)
    {
        return std::unexpected(make_config_error("/probe/read_size", "must be between 1 and 1048576"));
    }
    if (const auto payload = decode_hex_field(probe.payload_hex, "/probe/payload_hex"); !payload)
    {
        return std::unexpected(payload.error());
    }
    return {};
}

[[nodiscard]] std::expected<void, config_error> validate_config(const config& cfg)
{
    if (const auto r = validate_log_config(cfg.log); !r)
    {
        return r;
    }
    if (const auto r = validate_destination_config(cfg.destination); !r)
    {
        return r;
    }
    if (const auto r = validate_retry_config(cfg.retry); !r)
    {
        return r;
    }
    return validate_probe_config(cfg.probe);
}

[[nodiscard]] std::expected<std::string, config_error> read_file(const std::string& filename)
{
    char buf[64 * 1024];
    std::string result;
    FILE* f = std::fopen(filename.c_str(), "rb");
    if (f == nullptr)
    {
        return std::unexpected(make_config_error("/", std::string("open file failed: ") + std::strerror(errno)));
    }
    for (;;)
    {
        const std::size_t n = std::fread(buf, 1, sizeof buf, f);
        if (n > 0)
        {
            result.append(buf, n);
        }
        if (n < sizeof buf)
        {
            if (std::ferror(f) != 0)
            {
                std::fclose(f);
                return std::unexpected(make_config_error("/", std::string("read file failed: ") + std::strerror(errno)));
            }
            break;
        }
    }
    std::fclose(f);
    return result;
}

}    // namespace

std::expected<config, config_error> parse_config_text(const std::string& text)
{
    if (const auto nul_pos = text.find('\0'); nul_pos != std::string::npos)
    {
        return std::unexpected(make_config_error("/", "json parse error at offset " + std::to_string(nul_pos) + ": embedded nul byte"));
    }
    rapidjson::Document doc;
    const rapidjson::ParseResult parse_result = doc.Parse(text.data(), text.size());
    if (parse_result.IsError())
    {
        return std::unexpected(make_config_error(
            "/", "json parse error at offset " + std::to_string(parse_result.Offset()) + ": " + rapidjson::GetParseError_En(parse_result.Code())));
    }
    if (!doc.IsObject())
    {
        return std::unexpected(make_config_error("/", "must be an object"));
    }

    config cfg;
    if (const auto r = read_log_section(doc, cfg.log); !r)
    {
        return std::unexpected(r.error());
    }
    if (const auto r = read_destination_section(doc, cfg.destination); !r)
    {
        return std::unexpected(r.error());
    }
    if (const auto r = read_dial_section(doc, cfg.dial); !r)
    {
        return std::unexpected(r.error());
    }
    if (const auto r = read_retry_section(doc, cfg.retry); !r)
    {
        return std::unexpected(r.error());
    }
    if (const auto r = read_probe_section(doc, cfg.probe); !r)
    {
        return std::unexpected(r.error());
    }
    if (const auto r = validate_config(cfg); !r)
    {
        return std::unexpected(r.error());
    }
    return cfg;
}

std::expected<config, config_error> parse_config_with_error(const std::string& filename)
{
    const auto file_content = read_file(filename);
    if (!file_content)
    {
        return std::unexpected(file_content.error());
    }
    return parse_config_text(*file_content);
}

std::optional<config> parse_config(const std::string& filename)
{
    const auto parsed = parse_config_with_error(filename);
    if (!parsed)
    {
        return std::nullopt;
    }
    return *parsed;
}

std::string dump_config(const config& cfg)
{
    rapidjson::StringBuffer sb;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> w(sb);
    w.StartObject();

    w.Key("log");
    w.StartObject();
    w.Key("level");
    w.String(cfg.log.level.c_str(), static_cast<rapidjson::SizeType>(cfg.log.level.size()));
    w.Key("file");
    w.String(cfg.log.file.c_str(), static_cast<rapidjson::SizeType>(cfg.log.file.size()));
    w.EndObject();

    w.Key("destination");
    w.StartObject();
    w.Key("host");
    w.String(cfg.destination.host.c_str(), static_cast<rapidjson::SizeType>(cfg.destination.host.size()));
    w.Key("port");
    w.Uint(cfg.destination.port);
    w.EndObject();

    w.Key("dial");
    w.StartObject();
    w.Key("connect_timeout_ms");
    w.Uint(cfg.dial.connect_timeout_ms);
    w.Key("mark");
    w.Uint(cfg.dial.mark);
    w.Key("no_delay");
    w.Bool(cfg.dial.no_delay);
    w.EndObject();

    w.Key("retry");
    w.StartObject();
    w.Key("timeout_base_ms");
    w.Uint(cfg.retry.timeout_base_ms);
    w.Key("rtt_multiplier");
    w.Uint(cfg.retry.rtt_multiplier);
    w.Key("min_split");
    w.Uint(cfg.retry.min_split);
    w.Key("max_split");
    w.Uint(cfg.retry.max_split);
    w.Key("read_from_chunk");
    w.Uint(cfg.retry.read_from_chunk);
    w.EndObject();

    w.Key("probe");
    w.StartObject();
    w.Key("payload_hex");
    w.String(cfg.probe.payload_hex.c_str(), static_cast<rapidjson::SizeType>(cfg.probe.payload_hex.size()));
    w.Key("read_size");
    w.Uint(cfg.probe.read_size);
    w.EndObject();

    w.EndObject();
    return std::string(sb.GetString(), sb.GetSize());
}

std::string dump_default_config() { return dump_config(config{}); }

tcp_conn_options make_dial_options(const config& cfg)
{
    tcp_conn_options options;
    options.connect_timeout = std::chrono::milliseconds(cfg.dial.connect_timeout_ms);
    options.mark = cfg.dial.mark;
    options.no_delay = cfg.dial.no_delay;
    return options;
}

split_retry_options make_retry_options(const config& cfg)
{
    split_retry_options options;
    options.timeout.base = std::chrono::milliseconds(cfg.retry.timeout_base_ms);
    options.timeout.rtt_multiplier = cfg.retry.rtt_multiplier;
    options.splitter = std::make_shared<random_split>(cfg.retry.min_split, cfg.retry.max_split);
    options.read_from_chunk = cfg.retry.read_from_chunk;
    return options;
}

std::expected<std::vector<std::uint8_t>, config_error> decode_probe_payload(const config& cfg)
{
    return decode_hex_field(cfg.probe.payload_hex, "/probe/payload_hex");
}

}    // namespace tunnel
