#ifndef DUPLEX_CONN_H
#define DUPLEX_CONN_H

#include <chrono>
#include <cstddef>
#include <cstdint>

#include <boost/asio/buffer.hpp>
#include <boost/system/error_code.hpp>

namespace tunnel
{

struct io_result
{
    std::size_t size = 0;
    boost::system::error_code ec;
};

struct copy_result
{
    std::uint64_t size = 0;
    boost::system::error_code ec;
};

// End of stream is reported as boost::asio::error::eof.
class byte_reader
{
   public:
    virtual ~byte_reader() = default;

    [[nodiscard]] virtual io_result read(boost::asio::mutable_buffer buffer) = 0;
};

// A byte stream with independently closable halves. Intended for two-threaded
// use: one thread calls read and close_read, another calls write, read_from
// and close_write.
class duplex_conn : public byte_reader
{
   public:
    // Writes the whole buffer unless an error occurs.
    [[nodiscard]] virtual io_result write(boost::asio::const_buffer buffer) = 0;

    // Copies from reader until end of stream, which is not an error.
    [[nodiscard]] virtual copy_result read_from(byte_reader& reader) = 0;

    virtual boost::system::error_code close_read() = 0;

    virtual boost::system::error_code close_write() = 0;
};

class transport_conn : public duplex_conn
{
   public:
    static constexpr std::chrono::steady_clock::time_point kNoDeadline = std::chrono::steady_clock::time_point::max();

    // Applies to a read already in progress. May be called from the writer
    // thread. kNoDeadline clears it.
    virtual void set_read_deadline(std::chrono::steady_clock::time_point deadline) = 0;

    virtual boost::system::error_code close() = 0;
};

}    // namespace tunnel

#endif
