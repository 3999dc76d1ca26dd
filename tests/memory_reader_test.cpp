#include <array>
#include <vector>
#include <cstdint>
#include <utility>

#include <boost/asio.hpp>
#include <gtest/gtest.h>

#include "test_util.h"
#include "memory_reader.h"

namespace tunnel
{

TEST(memory_reader_test, ServesPayloadThenEof)
{
    const auto payload = test::make_payload(10);
    memory_reader reader(payload);
    std::array<std::uint8_t, 16> buf{};

    const auto r = reader.read(boost::asio::buffer(buf));
    ASSERT_FALSE(r.ec);
    EXPECT_EQ(r.size, 10U);
    EXPECT_EQ(std::vector<std::uint8_t>(buf.begin(), buf.begin() + 10), payload);
    EXPECT_EQ(reader.remaining(), 0U);

    const auto end = reader.read(boost::asio::buffer(buf));
    EXPECT_EQ(end.size, 0U);
    EXPECT_EQ(end.ec, boost::asio::error::eof);
}

TEST(memory_reader_test, MaxReadCapsEachRead)
{
    memory_reader reader(test::make_payload(10), 4);
    std::array<std::uint8_t, 16> buf{};
    EXPECT_EQ(reader.read(boost::asio::buffer(buf)).size, 4U);
    EXPECT_EQ(reader.read(boost::asio::buffer(buf)).size, 4U);
    EXPECT_EQ(reader.read(boost::asio::buffer(buf)).size, 2U);
    EXPECT_EQ(reader.read(boost::asio::buffer(buf)).ec, boost::asio::error::eof);
}

TEST(memory_reader_test, EmptyPayloadIsImmediateEof)
{
    memory_reader reader(std::vector<std::uint8_t>{});
    std::array<std::uint8_t, 4> buf{};
    EXPECT_EQ(reader.read(boost::asio::buffer(buf)).ec, boost::asio::error::eof);
}

}    // namespace tunnel
