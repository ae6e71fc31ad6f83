#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <boost/asio.hpp>
#include <boost/endian/conversion.hpp>
#include "network/tcp_request_channel.hpp"
#include "test_utils.hpp"

using namespace fileclient::network;
using boost::asio::ip::tcp;

// Accepts connections on a loopback port and answers each request frame
// with "reply:" + kind + ":" + payload
class EchoServer {
public:
  explicit EchoServer(int drop_first = 0, bool stall = false)
    : acceptor_(io_context_, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0)),
      drop_first_(drop_first),
      stall_(stall) {
    thread_ = std::thread([this] { serve(); });
  }

  ~EchoServer() {
    stopping_ = true;
    // Wake the blocking accept
    boost::system::error_code ec;
    boost::asio::io_context wake_context;
    tcp::socket wake(wake_context);
    wake.connect(tcp::endpoint(boost::asio::ip::address_v4::loopback(), port()), ec);
    if (thread_.joinable()) {
      thread_.join();
    }
    acceptor_.close(ec);
  }

  uint16_t port() const { return acceptor_.local_endpoint().port(); }
  int connections() const { return connections_; }

private:
  boost::asio::io_context io_context_;
  tcp::acceptor acceptor_;
  std::thread thread_;
  std::atomic<bool> stopping_{false};
  std::atomic<int> connections_{0};
  int drop_first_;
  bool stall_;

  void serve() {
    while (!stopping_) {
      tcp::socket socket(io_context_);
      boost::system::error_code ec;
      acceptor_.accept(socket, ec);
      if (ec || stopping_) {
        return;
      }
      const int index = ++connections_;
      if (index <= drop_first_) {
        continue;
      }
      if (stall_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        continue;
      }
      answer(socket);
    }
  }

  void answer(tcp::socket& socket) {
    boost::system::error_code ec;
    uint64_t size = 0;
    boost::asio::read(socket, boost::asio::buffer(&size, sizeof(size)), ec);
    if (ec) {
      return;
    }
    std::string body(boost::endian::big_to_native(size), '\0');
    boost::asio::read(socket, boost::asio::buffer(body), ec);
    if (ec || body.empty()) {
      return;
    }

    const auto kind_length = static_cast<uint8_t>(body[0]);
    const std::string kind = body.substr(1, kind_length);
    const std::string payload = body.substr(1 + kind_length);

    const std::string reply = "reply:" + kind + ":" + payload;
    const uint64_t reply_size = boost::endian::native_to_big(static_cast<uint64_t>(reply.size()));
    boost::asio::write(socket, boost::asio::buffer(&reply_size, sizeof(reply_size)), ec);
    boost::asio::write(socket, boost::asio::buffer(reply), ec);
  }
};

class TcpRequestChannelTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging(boost::log::trivial::error);
  }
};

TEST_F(TcpRequestChannelTest, FrameLayout) {
  const std::string frame = TcpRequestChannel::build_frame("aes", "xyz");
  const std::string expected = std::string("\x00\x00\x00\x00\x00\x00\x00\x07", 8)
                             + std::string("\x03", 1) + "aes" + "xyz";
  EXPECT_EQ(frame, expected);
  EXPECT_THROW(TcpRequestChannel::build_frame(std::string(300, 'k'), ""), std::invalid_argument);
}

TEST_F(TcpRequestChannelTest, SendsRequestAndReadsReply) {
  EchoServer server;
  TcpRequestChannel channel("127.0.0.1", server.port());

  EXPECT_EQ(channel.send("aes", "payload", 3, 5), "reply:aes:payload");
  EXPECT_EQ(channel.send("aes", std::string("\0\1\2", 3), 3, 5), "reply:aes:" + std::string("\0\1\2", 3));
}

TEST_F(TcpRequestChannelTest, RetriesDroppedConnections) {
  EchoServer server(2);
  TcpRequestChannel channel("127.0.0.1", server.port());

  EXPECT_EQ(channel.send("aes", "third time", 3, 5), "reply:aes:third time");
  EXPECT_EQ(server.connections(), 3);
}

TEST_F(TcpRequestChannelTest, ThrowsWhenTriesRunOut) {
  EchoServer server(5);
  TcpRequestChannel channel("127.0.0.1", server.port());

  EXPECT_THROW(channel.send("aes", "lost", 2, 5), TransportTimeoutError);
  EXPECT_EQ(server.connections(), 2);
}

TEST_F(TcpRequestChannelTest, TimesOutOnSilentMaster) {
  EchoServer server(0, true);
  TcpRequestChannel channel("127.0.0.1", server.port());

  const auto start = std::chrono::steady_clock::now();
  try {
    channel.send("aes", "anyone there", 1, 1);
    FAIL() << "Expected TransportTimeoutError";
  } catch (const TransportTimeoutError& e) {
    EXPECT_EQ(e.last_error(), NetworkError::TIMEOUT);
  }
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST_F(TcpRequestChannelTest, UnreachableMasterCountsAsTimeout) {
  uint16_t closed_port;
  {
    boost::asio::io_context io_context;
    tcp::acceptor acceptor(io_context, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    closed_port = acceptor.local_endpoint().port();
  }
  TcpRequestChannel channel("127.0.0.1", closed_port);

  try {
    channel.send("aes", "hello", 2, 2);
    FAIL() << "Expected TransportTimeoutError";
  } catch (const TransportTimeoutError& e) {
    EXPECT_EQ(e.last_error(), NetworkError::CONNECTION_FAILED);
  }
}
