#include <mutex>
#include <chrono>
#include <memory>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <expected>

#include <boost/asio/error.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>

#include "log.h"
#include "net_utils.h"
#include "statistics.h"
#include "log_context.h"
#include "split_hello.h"
#include "split_retry_conn.h"

namespace tunnel
{

split_retry_conn::split_retry_conn(std::shared_ptr<dialer> dialer,
                                   const boost::asio::ip::tcp::endpoint& destination,
                                   std::shared_ptr<transport_conn> conn,
                                   const std::chrono::steady_clock::duration timeout,
                                   split_retry_options options)
    : dialer_(std::move(dialer)),
      destination_(destination),
      conn_(std::move(conn)),
      timeout_(timeout),
      splitter_(std::move(options.splitter)),
      read_from_chunk_(options.read_from_chunk > 0 ? options.read_from_chunk : 2048),
      ctx_(stream_context::make(net::endpoint_to_string(destination)))
{
    if (splitter_ == nullptr)
    {
        splitter_ = std::make_shared<random_split>();
    }
}

io_result split_retry_conn::read(const boost::asio::mutable_buffer buffer)
{
    auto result = conn_->read(buffer);
    if (result.size == 0 && !result.ec)
    {
        // An empty read neither confirms the connection nor condemns it.
        return result;
    }
    if (!retry_complete_flag_.is_closed())
    {
        const std::lock_guard<std::mutex> lock(mutex_);
        if (result.ec)
        {
            result = retry(buffer);
        }
        finish_retry_window();
    }
    return result;
}

io_result split_retry_conn::retry(const boost::asio::mutable_buffer buffer)
{
    statistics::instance().inc_retries();
    LOG_CTX_INFO(ctx_, "{} first read failed, redialing with {} hello bytes", log_event::kRetry, hello_.size());

    if (const auto ec = conn_->close(); ec)
    {
        LOG_CTX_WARN(ctx_, "{} close provisional connection failed {}", log_event::kRetry, ec.message());
    }

    auto dialed = dialer_->dial(destination_);
    if (!dialed)
    {
        // conn_ stays on the closed provisional connection, so a writer
        // blocked on the retry fails against it.
        statistics::instance().inc_retry_dial_failures();
        LOG_CTX_WARN(ctx_, "{} redial failed {}", log_event::kRetry, dialed.error().message());
        return io_result{.size = 0, .ec = dialed.error()};
    }
    conn_ = std::move(*dialed);
    retried_ = true;

    const auto segments = split_hello(hello_, *splitter_);
    LOG_CTX_DEBUG(ctx_, "{} hello {} split {} + {}", log_event::kSplit, hello_.size(), segments.first.size(), segments.second.size());
    for (const auto segment : {segments.first, segments.second})
    {
        if (const auto w = conn_->write(boost::asio::buffer(segment.data(), segment.size())); w.ec)
        {
            statistics::instance().inc_retry_write_failures();
            LOG_CTX_WARN(ctx_, "{} replay write failed {}", log_event::kRetry, w.ec.message());
            return io_result{.size = 0, .ec = w.ec};
        }
    }
    statistics::instance().add_bytes_replayed(hello_.size());

    replay_half_closes();

    auto result = conn_->read(buffer);
    if (result.size > 0)
    {
        statistics::instance().inc_retries_recovered();
        LOG_CTX_INFO(ctx_, "{} recovered after {}", log_event::kRetry, format_latency_ms(ctx_.elapsed_ms()));
    }
    return result;
}

void split_retry_conn::replay_half_closes()
{
    // The caller may have half-closed the old connection while the new one was
    // being dialed. Both shutdowns are idempotent, so repeating one that
    // already reached the new connection is harmless.
    if (read_close_flag_.is_closed())
    {
        if (const auto ec = conn_->close_read(); ec)
        {
            LOG_CTX_WARN(ctx_, "{} replay close read failed {}", log_event::kHalfClose, ec.message());
        }
    }
    if (write_close_flag_.is_closed())
    {
        if (const auto ec = conn_->close_write(); ec)
        {
            LOG_CTX_WARN(ctx_, "{} replay close write failed {}", log_event::kHalfClose, ec.message());
        }
    }
}

void split_retry_conn::finish_retry_window()
{
    hello_.clear();
    hello_.shrink_to_fit();
    conn_->set_read_deadline(transport_conn::kNoDeadline);
    // Release: publishes the final conn_ to the lock-free paths.
    retry_complete_flag_.close();
}

io_result split_retry_conn::write(const boost::asio::const_buffer buffer)
{
    if (buffer.size() == 0)
    {
        return {};
    }

    std::shared_ptr<transport_conn> conn;
    io_result result;
    // Double-checked locking. is_closed() is an acquire load paired with the
    // release in finish_retry_window(), so a writer that sees the flag closed
    // also sees the final conn_ and may skip the lock for good. The second
    // check under mutex_ keeps hello_ from growing after it was cleared.
    if (!retry_complete_flag_.is_closed())
    {
        const std::lock_guard<std::mutex> lock(mutex_);
        if (!retry_complete_flag_.is_closed())
        {
            conn = conn_;
            result = conn->write(buffer);
            const auto* bytes = static_cast<const std::uint8_t*>(buffer.data());
            hello_.insert(hello_.end(), bytes, bytes + result.size);
            // A reply, or another write, has to arrive before this deadline.
            conn->set_read_deadline(std::chrono::steady_clock::now() + timeout_);
        }
    }

    if (result.ec)
    {
        // The provisional connection failed. The reader settles the retry, and
        // the final connection will already have replayed what went through,
        // so only the remainder is left to send.
        LOG_CTX_DEBUG(ctx_, "{} provisional write failed {}, waiting for retry", log_event::kRetry, result.ec.message());
        retry_complete_flag_.wait();
        const auto rest = conn_->write(buffer + result.size);
        result.size += rest.size;
        result.ec = rest.ec;
        return result;
    }

    if (conn == nullptr)
    {
        return conn_->write(buffer);
    }
    return result;
}

copy_result split_retry_conn::read_from(byte_reader& reader)
{
    copy_result total;
    if (!retry_complete_flag_.is_closed())
    {
        std::vector<std::uint8_t> buf(read_from_chunk_);
        while (!retry_complete_flag_.is_closed())
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

    const auto rest = conn_->read_from(reader);
    total.size += rest.size;
    total.ec = rest.ec;
    return total;
}

boost::system::error_code split_retry_conn::close_read()
{
    read_close_flag_.close();
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto ec = conn_->close_read();
    LOG_CTX_DEBUG(ctx_, "{} close read {}", log_event::kHalfClose, ec ? ec.message() : "ok");
    return ec;
}

boost::system::error_code split_retry_conn::close_write()
{
    write_close_flag_.close();
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto ec = conn_->close_write();
    LOG_CTX_DEBUG(ctx_, "{} close write {}", log_event::kHalfClose, ec ? ec.message() : "ok");
    return ec;
}

std::size_t split_retry_conn::hello_size() const
{
    const std::lock_guard<std::mutex> lock(mutex_);
    return hello_.size();
}

std::expected<std::shared_ptr<split_retry_conn>, boost::system::error_code> dial_with_split_retry(std::shared_ptr<dialer> dialer,
                                                                                                const boost::asio::ip::tcp::endpoint& destination,
                                                                                                split_retry_options options)
{
    if (dialer == nullptr)
    {
        return std::unexpected(boost::asio::error::invalid_argument);
    }

    statistics::instance().inc_dials();
    const auto before = std::chrono::steady_clock::now();
    auto conn = dialer->dial(destination);
    if (!conn)
    {
        statistics::instance().inc_dial_failures();
        LOG_WARN("{} {} failed {}", log_event::kDial, net::endpoint_to_string(destination), conn.error().message());
        return std::unexpected(conn.error());
    }
    const auto after = std::chrono::steady_clock::now();

    const auto timeout = options.timeout.estimate(before, after);
    auto stream = std::make_shared<split_retry_conn>(std::move(dialer), destination, std::move(*conn), timeout, std::move(options));
    LOG_CTX_DEBUG(stream->context(),
                  "{} connected in {} retry timeout {}",
                  log_event::kDial,
                  format_latency_ms(std::chrono::duration_cast<std::chrono::milliseconds>(after - before).count()),
                  format_latency_ms(std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count()));
    return stream;
}

}    // namespace tunnel
