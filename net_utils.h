#ifndef NET_UTILS_H
#define NET_UTILS_H

#include <string>
#include <cstdint>
#include <expected>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/system/error_code.hpp>

namespace tunnel::net
{

// mark == 0 leaves the socket untouched.
[[nodiscard]] std::expected<void, boost::system::error_code> set_socket_mark(int fd, std::uint32_t mark);

[[nodiscard]] boost::asio::ip::address normalize_address(const boost::asio::ip::address& addr);

// host must be an ip literal; no name resolution happens here.
[[nodiscard]] std::expected<boost::asio::ip::tcp::endpoint, boost::system::error_code> make_tcp_endpoint(const std::string& host,
                                                                                                        std::uint16_t port);

[[nodiscard]] std::string endpoint_to_string(const boost::asio::ip::tcp::endpoint& endpoint);

}    // namespace tunnel::net

#endif
