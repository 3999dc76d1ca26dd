#include <memory>
#include <expected>

#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>

#include "log.h"
#include "dialer.h"
#include "tcp_conn.h"
#include "net_utils.h"
#include "log_context.h"

namespace tunnel
{

dial_result tcp_dialer::dial(const boost::asio::ip::tcp::endpoint& endpoint)
{
    auto conn = std::make_shared<tcp_conn>();
    if (const auto ec = conn->connect(endpoint, options_); ec)
    {
        LOG_DEBUG("{} {} connect failed {}", log_event::kDial, net::endpoint_to_string(endpoint), ec.message());
        return std::unexpected(ec);
    }
    return conn;
}

}    // namespace tunnel
