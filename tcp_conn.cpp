#include <chrono>
#include <vector>
#include <cstddef>
#include <cstdint>

#include <boost/asio/post.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>

#include "log.h"
#include "tcp_conn.h"
#include "net_utils.h"
#include "log_context.h"

namespace tunnel
{

tcp_conn::tcp_conn() : socket_(io_), deadline_timer_(io_) {}

boost::system::error_code tcp_conn::connect(const boost::asio::ip::tcp::endpoint& endpoint, const tcp_conn_options& options)
{
    if (socket_.is_open())
    {
        return boost::asio::error::already_connected;
    }

    boost::system::error_code ec;
    socket_.open(endpoint.protocol(), ec);
    if (ec)
    {
        return ec;
    }

    if (auto mark_result = net::set_socket_mark(socket_.native_handle(), options.mark); !mark_result)
    {
        LOG_WARN("tcp conn set mark {} failed {}", options.mark, mark_result.error().message());
    }

    bool done = false;
    bool timed_out = false;
    boost::system::error_code connect_ec;
    socket_.async_connect(endpoint,
                          [&connect_ec, &done](const boost::system::error_code& e)
                          {
                              connect_ec = e;
                              done = true;
                          });
    if (options.connect_timeout.count() > 0)
    {
        deadline_timer_.expires_after(options.connect_timeout);
        deadline_timer_.async_wait(
            [this, &done, &timed_out](const boost::system::error_code& e)
            {
                if (e || done)
                {
                    return;
                }
                timed_out = true;
                boost::system::error_code cancel_ec;
                socket_.cancel(cancel_ec);
            });
    }
    run_until(done);

    // The timer handler refers to locals of this frame, drain it before leaving.
    deadline_timer_.cancel();
    io_.restart();
    io_.poll();

    if (connect_ec == boost::asio::error::operation_aborted && timed_out)
    {
        connect_ec = boost::asio::error::timed_out;
    }
    if (connect_ec)
    {
        boost::system::error_code close_ec;
        socket_.close(close_ec);
        return connect_ec;
    }

    if (options.no_delay)
    {
        socket_.set_option(boost::asio::ip::tcp::no_delay(true), ec);
        if (ec)
        {
            LOG_WARN("tcp conn set no delay failed {}", ec.message());
        }
    }
    return {};
}

io_result tcp_conn::read(const boost::asio::mutable_buffer buffer)
{
    if (buffer.size() == 0)
    {
        return {};
    }

    apply_pending_deadline();
    if (deadline_ != kNoDeadline && std::chrono::steady_clock::now() >= deadline_)
    {
        return io_result{.size = 0, .ec = boost::asio::error::timed_out};
    }

    read_timed_out_ = false;
    bool done = false;
    io_result result;
    socket_.async_read_some(buffer,
                            [&result, &done](const boost::system::error_code& ec, const std::size_t n)
                            {
                                result.size = n;
                                result.ec = ec;
                                done = true;
                            });
    run_until(done);

    if (result.ec == boost::asio::error::operation_aborted && read_timed_out_)
    {
        result.ec = boost::asio::error::timed_out;
    }
    return result;
}

io_result tcp_conn::write(const boost::asio::const_buffer buffer)
{
    boost::system::error_code ec;
    const std::size_t n = boost::asio::write(socket_, buffer, ec);
    return io_result{.size = n, .ec = ec};
}

copy_result tcp_conn::read_from(byte_reader& reader)
{
    std::vector<std::uint8_t> buf(kCopyBufferSize);
    copy_result total;
    for (;;)
    {
        const auto r = reader.read(boost::asio::buffer(buf));
        if (r.size > 0)
        {
            const auto w = write(boost::asio::buffer(buf.data(), r.size));
            total.size += w.size;
            if (w.ec)
            {
                total.ec = w.ec;
                return total;
            }
        }
        if (r.ec)
        {
            if (r.ec != boost::asio::error::eof)
            {
                total.ec = r.ec;
            }
            return total;
        }
    }
}

boost::system::error_code tcp_conn::close_read()
{
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_receive, ec);
    return ec;
}

boost::system::error_code tcp_conn::close_write()
{
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
    return ec;
}

void tcp_conn::set_read_deadline(const std::chrono::steady_clock::time_point deadline)
{
    boost::asio::post(io_, [this, deadline]() { arm_deadline(deadline); });
}

boost::system::error_code tcp_conn::close()
{
    boost::system::error_code ec;
    socket_.close(ec);
    return ec;
}

boost::asio::ip::tcp::endpoint tcp_conn::local_endpoint() const
{
    boost::system::error_code ec;
    auto endpoint = socket_.local_endpoint(ec);
    if (ec)
    {
        return {};
    }
    return endpoint;
}

void tcp_conn::arm_deadline(const std::chrono::steady_clock::time_point deadline)
{
    deadline_ = deadline;
    if (deadline == kNoDeadline)
    {
        deadline_timer_.cancel();
        return;
    }
    deadline_timer_.expires_at(deadline);
    deadline_timer_.async_wait([this](const boost::system::error_code& ec) { on_deadline(ec); });
}

void tcp_conn::on_deadline(const boost::system::error_code& ec)
{
    if (ec == boost::asio::error::operation_aborted)
    {
        return;
    }
    // A later arm may have moved the deadline after this wait completed.
    if (deadline_ == kNoDeadline || std::chrono::steady_clock::now() < deadline_)
    {
        return;
    }
    read_timed_out_ = true;
    LOG_TRACE("{} read deadline expired fd {}", log_event::kDeadline, socket_.native_handle());
    boost::system::error_code cancel_ec;
    socket_.cancel(cancel_ec);
}

void tcp_conn::apply_pending_deadline()
{
    io_.restart();
    io_.poll();
}

void tcp_conn::run_until(const bool& done)
{
    io_.restart();
    while (!done)
    {
        if (io_.run_one() == 0)
        {
            io_.restart();
        }
    }
}

}    // namespace tunnel
