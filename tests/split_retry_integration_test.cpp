#include <array>
#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <thread>
#include <vector>
#include <cstdint>

#include <boost/asio.hpp>
#include <gtest/gtest.h>

#include "dialer.h"
#include "test_util.h"
#include "statistics.h"
#include "split_hello.h"
#include "memory_reader.h"
#include "split_retry_conn.h"

namespace tunnel
{

namespace
{

using socket_type = boost::asio::ip::tcp::socket;

void write_text(socket_type& socket, const std::string& text)
{
    boost::system::error_code ec;
    boost::asio::write(socket, boost::asio::buffer(text), ec);
}

std::string read_text(split_retry_conn& conn)
{
    std::array<char, 256> buf{};
    const auto r = conn.read(boost::asio::buffer(buf));
    if (r.ec)
    {
        ADD_FAILURE() << "read failed: " << r.ec.message();
        return {};
    }
    return std::string(buf.data(), r.size);
}

void echo_until_eof(socket_type& socket)
{
    std::array<char, 1024> buf{};
    for (;;)
    {
        boost::system::error_code ec;
        const auto n = socket.read_some(boost::asio::buffer(buf), ec);
        if (ec)
        {
            return;
        }
        boost::asio::write(socket, boost::asio::buffer(buf.data(), n), ec);
        if (ec)
        {
            return;
        }
    }
}

}    // namespace

class split_retry_integration_test : public ::testing::Test
{
   protected:
    void SetUp() override { statistics::instance().reset(); }

    static split_retry_options options_with(const std::chrono::milliseconds base)
    {
        split_retry_options options;
        options.timeout.base = base;
        options.splitter = std::make_shared<random_split>(random_split::kMinSplit, random_split::kMaxSplit, 9);
        return options;
    }

    std::shared_ptr<dialer> dialer_ = std::make_shared<tcp_dialer>(tcp_conn_options{.connect_timeout = std::chrono::milliseconds(2000)});
};

TEST_F(split_retry_integration_test, ResetAfterHelloIsRetriedOnAFreshConnection)
{
    const auto hello = test::make_payload(300);
    std::vector<std::uint8_t> first_seen;
    std::vector<std::uint8_t> second_seen;
    test::scripted_tcp_server server({
        [&](socket_type& s)
        {
            first_seen = test::read_exactly(s, hello.size());
            test::reset_socket(s);
        },
        [&](socket_type& s)
        {
            second_seen = test::read_exactly(s, hello.size());
            write_text(s, "pong");
            test::read_until_eof(s);
        },
    });

    auto conn = dial_with_split_retry(dialer_, server.endpoint(), options_with(std::chrono::milliseconds(2000)));
    ASSERT_TRUE(conn.has_value()) << conn.error().message();
    auto& stream = **conn;

    const auto w = stream.write(boost::asio::buffer(hello));
    ASSERT_FALSE(w.ec) << w.ec.message();
    EXPECT_EQ(read_text(stream), "pong");
    EXPECT_FALSE(stream.close_write());
    server.join();

    EXPECT_EQ(first_seen, hello);
    EXPECT_EQ(second_seen, hello);
    EXPECT_TRUE(stream.retried());
    EXPECT_EQ(server.accepted(), 2U);
    EXPECT_EQ(statistics::instance().retries_recovered(), 1U);
    EXPECT_EQ(statistics::instance().bytes_replayed(), hello.size());
}

TEST_F(split_retry_integration_test, SilentServerIsRetriedAfterTheTimeout)
{
    const auto hello = test::make_payload(120);
    std::vector<std::uint8_t> second_seen;
    test::scripted_tcp_server server({
        [&](socket_type& s)
        {
            test::read_exactly(s, hello.size());
            test::read_until_eof(s);
        },
        [&](socket_type& s)
        {
            second_seen = test::read_exactly(s, hello.size());
            write_text(s, "late pong");
            test::read_until_eof(s);
        },
    });

    auto conn = dial_with_split_retry(dialer_, server.endpoint(), options_with(std::chrono::milliseconds(100)));
    ASSERT_TRUE(conn.has_value()) << conn.error().message();
    auto& stream = **conn;

    const auto start = std::chrono::steady_clock::now();
    ASSERT_FALSE(stream.write(boost::asio::buffer(hello)).ec);
    EXPECT_EQ(read_text(stream), "late pong");
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(90));

    EXPECT_FALSE(stream.close_write());
    server.join();
    EXPECT_EQ(second_seen, hello);
    EXPECT_TRUE(stream.retried());
}

TEST_F(split_retry_integration_test, ResponsiveServerIsNeverRetried)
{
    test::scripted_tcp_server server({echo_until_eof});

    auto conn = dial_with_split_retry(dialer_, server.endpoint(), options_with(std::chrono::milliseconds(50)));
    ASSERT_TRUE(conn.has_value()) << conn.error().message();
    auto& stream = **conn;

    const std::string ping = "ping";
    ASSERT_FALSE(stream.write(boost::asio::buffer(ping)).ec);
    EXPECT_EQ(read_text(stream), "ping");
    EXPECT_TRUE(stream.retry_completed());
    EXPECT_FALSE(stream.retried());

    // Idle past the retry timeout; the deadline must not outlive the decision.
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    const std::string again = "again";
    ASSERT_FALSE(stream.write(boost::asio::buffer(again)).ec);
    EXPECT_EQ(read_text(stream), "again");

    EXPECT_FALSE(stream.close_write());
    std::array<char, 8> buf{};
    EXPECT_EQ(stream.read(boost::asio::buffer(buf)).ec, boost::asio::error::eof);
    server.join();
    EXPECT_EQ(server.accepted(), 1U);
    EXPECT_EQ(statistics::instance().retries(), 0U);
}

TEST_F(split_retry_integration_test, ReadFromDuringRetryWindowIsBufferedAsHello)
{
    const auto body = test::make_payload(50000);
    std::vector<std::uint8_t> received;
    test::scripted_tcp_server server({
        [&](socket_type& s)
        {
            received = test::read_until_eof(s);
            write_text(s, "done");
        },
    });

    auto conn = dial_with_split_retry(dialer_, server.endpoint(), options_with(std::chrono::milliseconds(2000)));
    ASSERT_TRUE(conn.has_value()) << conn.error().message();
    auto& stream = **conn;

    memory_reader reader(body);
    const auto copied = stream.read_from(reader);
    ASSERT_FALSE(copied.ec) << copied.ec.message();
    EXPECT_EQ(copied.size, body.size());
    EXPECT_EQ(stream.hello_size(), body.size());

    EXPECT_FALSE(stream.close_write());
    EXPECT_EQ(read_text(stream), "done");
    EXPECT_EQ(stream.hello_size(), 0U);
    server.join();
    EXPECT_EQ(received, body);
}

TEST_F(split_retry_integration_test, RefusedDialIsReported)
{
    const auto conn = dial_with_split_retry(dialer_, test::closed_loopback_endpoint());
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error(), boost::asio::error::connection_refused);
    EXPECT_EQ(statistics::instance().dial_failures(), 1U);
}

}    // namespace tunnel
