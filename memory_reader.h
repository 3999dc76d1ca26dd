#ifndef MEMORY_READER_H
#define MEMORY_READER_H

#include <vector>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <algorithm>

#include <boost/asio/error.hpp>
#include <boost/asio/buffer.hpp>

#include "duplex_conn.h"

namespace tunnel
{

// Serves a fixed payload in reads of at most max_read bytes, then eof.
class memory_reader final : public byte_reader
{
   public:
    explicit memory_reader(std::vector<std::uint8_t> data, const std::size_t max_read = 0) : data_(std::move(data)), max_read_(max_read) {}

    [[nodiscard]] io_result read(const boost::asio::mutable_buffer buffer) override
    {
        if (offset_ >= data_.size())
        {
            return io_result{.size = 0, .ec = boost::asio::error::eof};
        }
        std::size_t n = std::min(buffer.size(), data_.size() - offset_);
        if (max_read_ > 0)
        {
            n = std::min(n, max_read_);
        }
        const std::size_t copied = boost::asio::buffer_copy(buffer, boost::asio::buffer(data_.data() + offset_, n));
        offset_ += copied;
        return io_result{.size = copied, .ec = {}};
    }

    [[nodiscard]] std::size_t remaining() const { return data_.size() - offset_; }

   private:
    std::vector<std::uint8_t> data_;
    std::size_t max_read_;
    std::size_t offset_ = 0;
};

}    // namespace tunnel

#endif
