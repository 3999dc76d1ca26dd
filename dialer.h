#ifndef DIALER_H
#define DIALER_H

#include <memory>
#include <expected>

#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>

#include "tcp_conn.h"
#include "duplex_conn.h"

namespace tunnel
{

using dial_result = std::expected<std::shared_ptr<transport_conn>, boost::system::error_code>;

class dialer
{
   public:
    virtual ~dialer() = default;

    [[nodiscard]] virtual dial_result dial(const boost::asio::ip::tcp::endpoint& endpoint) = 0;
};

class tcp_dialer final : public dialer
{
   public:
    explicit tcp_dialer(tcp_conn_options options = {}) : options_(options) {}

    [[nodiscard]] dial_result dial(const boost::asio::ip::tcp::endpoint& endpoint) override;

    [[nodiscard]] const tcp_conn_options& options() const { return options_; }

   private:
    tcp_conn_options options_;
};

}    // namespace tunnel

#endif
