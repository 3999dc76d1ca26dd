#include <cerrno>
#include <string>
#include <cstdint>
#include <expected>
#include <sys/socket.h>

#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/system/error_code.hpp>

#include "net_utils.h"

namespace tunnel::net
{

std::expected<void, boost::system::error_code> set_socket_mark(const int fd, const std::uint32_t mark)
{
    if (mark == 0)
    {
        return {};
    }
#ifdef __linux__
    if (setsockopt(fd, SOL_SOCKET, SO_MARK, &mark, sizeof(mark)) != 0)
    {
        return std::unexpected(boost::system::error_code(errno, boost::system::system_category()));
    }
    return {};
#else
    (void)fd;
    return std::unexpected(boost::asio::error::operation_not_supported);
#endif
}

boost::asio::ip::address normalize_address(const boost::asio::ip::address& addr)
{
    if (addr.is_v6())
    {
        const auto v6 = addr.to_v6();
        if (v6.is_v4_mapped())
        {
            const auto bytes = v6.to_bytes();
            const boost::asio::ip::address_v4::bytes_type v4_bytes = {bytes[12], bytes[13], bytes[14], bytes[15]};
            return boost::asio::ip::address_v4(v4_bytes);
        }
    }
    return addr;
}

std::expected<boost::asio::ip::tcp::endpoint, boost::system::error_code> make_tcp_endpoint(const std::string& host, const std::uint16_t port)
{
    if (port == 0)
    {
        return std::unexpected(boost::asio::error::invalid_argument);
    }
    boost::system::error_code ec;
    const auto addr = boost::asio::ip::make_address(host, ec);
    if (ec)
    {
        return std::unexpected(ec);
    }
    return boost::asio::ip::tcp::endpoint(normalize_address(addr), port);
}

std::string endpoint_to_string(const boost::asio::ip::tcp::endpoint& endpoint)
{
    const auto addr = endpoint.address();
    if (addr.is_v6())
    {
        return "[" + addr.to_string() + "]:" + std::to_string(endpoint.port());
    }
    return addr.to_string() + ":" + std::to_string(endpoint.port());
}

}    // namespace tunnel::net
