#ifndef TCP_CONN_H
#define TCP_CONN_H

#include <chrono>
#include <cstddef>
#include <cstdint>

#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include "duplex_conn.h"

namespace tunnel
{

struct tcp_conn_options
{
    // Zero waits for the kernel's own connect timeout.
    std::chrono::milliseconds connect_timeout{5000};
    std::uint32_t mark = 0;
    bool no_delay = true;
};

// Blocking TCP connection. Reads run on a private io_context so they can race
// a deadline timer; writes and half-closes are plain synchronous socket calls,
// which lets a writer thread use the connection while a reader is blocked.
class tcp_conn final : public transport_conn
{
   public:
    static constexpr std::size_t kCopyBufferSize = 32 * 1024;

    tcp_conn();
    ~tcp_conn() override = default;

    tcp_conn(const tcp_conn&) = delete;
    tcp_conn& operator=(const tcp_conn&) = delete;

    [[nodiscard]] boost::system::error_code connect(const boost::asio::ip::tcp::endpoint& endpoint, const tcp_conn_options& options);

    [[nodiscard]] io_result read(boost::asio::mutable_buffer buffer) override;

    [[nodiscard]] io_result write(boost::asio::const_buffer buffer) override;

    [[nodiscard]] copy_result read_from(byte_reader& reader) override;

    boost::system::error_code close_read() override;

    boost::system::error_code close_write() override;

    void set_read_deadline(std::chrono::steady_clock::time_point deadline) override;

    boost::system::error_code close() override;

    [[nodiscard]] bool is_open() const { return socket_.is_open(); }

    [[nodiscard]] boost::asio::ip::tcp::endpoint local_endpoint() const;

   private:
    void arm_deadline(std::chrono::steady_clock::time_point deadline);
    void on_deadline(const boost::system::error_code& ec);
    void apply_pending_deadline();
    void run_until(const bool& done);

   private:
    boost::asio::io_context io_{1};
    boost::asio::ip::tcp::socket socket_;
    boost::asio::steady_timer deadline_timer_;
    // Touched only by the thread running io_, i.e. the reader.
    std::chrono::steady_clock::time_point deadline_ = kNoDeadline;
    bool read_timed_out_ = false;
};

}    // namespace tunnel

#endif
