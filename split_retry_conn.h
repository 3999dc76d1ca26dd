#ifndef SPLIT_RETRY_CONN_H
#define SPLIT_RETRY_CONN_H

#include <mutex>
#include <chrono>
#include <memory>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <expected>

#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>

#include "dialer.h"
#include "duplex_conn.h"
#include "log_context.h"
#include "split_hello.h"
#include "one_shot_flag.h"
#include "retry_timeout.h"

namespace tunnel
{

struct split_retry_options
{
    retry_timeout_policy timeout;
    // Null selects random_split with its default bounds.
    std::shared_ptr<split_strategy> splitter;
    // Large enough to carry an ordinary first write without splitting it.
    std::size_t read_from_chunk = 2048;
};

// A TCP stream that retries once, by redialing and replaying the hello split
// in two segments, if the first read fails. The hello is everything written
// before that first read settles.
//
// Like any duplex_conn it serves two threads: a reader calling read and
// close_read, and a writer calling write, read_from and close_write.
//
// mutex_ guards conn_ and hello_ while the retry question is open. read() is
// the only place that modifies them, and it closes retry_complete_flag_ under
// mutex_ after its last change. From then on conn_ is immutable and both
// threads use it without locking.
class split_retry_conn final : public duplex_conn
{
   public:
    split_retry_conn(std::shared_ptr<dialer> dialer,
                     const boost::asio::ip::tcp::endpoint& destination,
                     std::shared_ptr<transport_conn> conn,
                     std::chrono::steady_clock::duration timeout,
                     split_retry_options options = {});

    split_retry_conn(const split_retry_conn&) = delete;
    split_retry_conn& operator=(const split_retry_conn&) = delete;

    [[nodiscard]] io_result read(boost::asio::mutable_buffer buffer) override;

    [[nodiscard]] io_result write(boost::asio::const_buffer buffer) override;

    [[nodiscard]] copy_result read_from(byte_reader& reader) override;

    boost::system::error_code close_read() override;

    boost::system::error_code close_write() override;

    [[nodiscard]] bool retry_completed() const { return retry_complete_flag_.is_closed(); }

    // Meaningful once retry_completed() is true.
    [[nodiscard]] bool retried() const { return retry_complete_flag_.is_closed() && retried_; }

    [[nodiscard]] std::size_t hello_size() const;

    [[nodiscard]] std::chrono::steady_clock::duration timeout() const { return timeout_; }

    [[nodiscard]] const boost::asio::ip::tcp::endpoint& destination() const { return destination_; }

    [[nodiscard]] const stream_context& context() const { return ctx_; }

   private:
    io_result retry(boost::asio::mutable_buffer buffer);
    void replay_half_closes();
    void finish_retry_window();

   private:
    mutable std::mutex mutex_;
    std::shared_ptr<dialer> dialer_;
    const boost::asio::ip::tcp::endpoint destination_;
    // Replaced only by the reader thread, so read() may use it without locking.
    std::shared_ptr<transport_conn> conn_;
    const std::chrono::steady_clock::duration timeout_;
    std::shared_ptr<split_strategy> splitter_;
    const std::size_t read_from_chunk_;
    std::vector<std::uint8_t> hello_;
    bool retried_ = false;
    one_shot_flag retry_complete_flag_;
    one_shot_flag read_close_flag_;
    one_shot_flag write_close_flag_;
    stream_context ctx_;
};

// Dials destination and wraps the connection. The measured connect time sets
// the timeout that a hello reply must beat before the stream retries.
[[nodiscard]] std::expected<std::shared_ptr<split_retry_conn>, boost::system::error_code> dial_with_split_retry(
    std::shared_ptr<dialer> dialer, const boost::asio::ip::tcp::endpoint& destination, split_retry_options options = {});

}    // namespace tunnel

#endif
