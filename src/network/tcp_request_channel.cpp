#include "network/tcp_request_channel.hpp"
#include <chrono>
#include <functional>
#include <stdexcept>
#include <boost/asio.hpp>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

namespace fileclient {
namespace network {

namespace {

using boost::asio::ip::tcp;

// State of a single request/reply cycle. Handlers chain through
// resolve -> connect -> write -> read size -> read payload.
class Exchange {
public:
  Exchange(boost::asio::io_context& io_context, const std::string& frame)
    : resolver_(io_context), socket_(io_context), frame_(frame) {}

  void start(const std::string& host, uint16_t port) {
    resolver_.async_resolve(host, std::to_string(port),
                            std::bind(&Exchange::handle_resolve, this,
                                      std::placeholders::_1,
                                      std::placeholders::_2));
  }

  bool is_complete() const { return complete_; }
  NetworkError get_error() const { return error_; }
  std::string& get_reply() { return reply_; }

  void close() {
    boost::system::error_code ec;
    resolver_.cancel();
    socket_.close(ec);
  }

private:
  tcp::resolver resolver_;
  tcp::socket socket_;
  const std::string& frame_;
  uint64_t reply_size_ = 0;
  std::string reply_;
  bool complete_ = false;
  NetworkError error_ = NetworkError::TIMEOUT;

  void handle_resolve(const boost::system::error_code& ec, const tcp::resolver::results_type& endpoints) {
    if (ec) {
      fail(NetworkError::CONNECTION_FAILED, "Resolve failed: " + ec.message());
      return;
    }
    boost::asio::async_connect(socket_, endpoints,
                               std::bind(&Exchange::handle_connect, this,
                                         std::placeholders::_1));
  }

  void handle_connect(const boost::system::error_code& ec) {
    if (ec) {
      fail(NetworkError::CONNECTION_FAILED, "Connect failed: " + ec.message());
      return;
    }
    BOOST_LOG_TRIVIAL(trace) << "TCP channel: Connected, sending " << frame_.size() << " bytes";
    boost::asio::async_write(socket_, boost::asio::buffer(frame_),
                             std::bind(&Exchange::handle_write, this,
                                       std::placeholders::_1,
                                       std::placeholders::_2));
  }

  void handle_write(const boost::system::error_code& ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      fail(NetworkError::CONNECTION_LOST, "Write failed: " + ec.message());
      return;
    }
    boost::asio::async_read(socket_, boost::asio::buffer(&reply_size_, sizeof(reply_size_)),
                            std::bind(&Exchange::handle_read_size, this,
                                      std::placeholders::_1,
                                      std::placeholders::_2));
  }

  void handle_read_size(const boost::system::error_code& ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      fail(NetworkError::CONNECTION_LOST, "Size read failed: " + ec.message());
      return;
    }
    reply_size_ = boost::endian::big_to_native(reply_size_);
    if (reply_size_ > TcpRequestChannel::MAX_REPLY_SIZE) {
      fail(NetworkError::MALFORMED_REPLY, "Reply size out of range: " + std::to_string(reply_size_));
      return;
    }

    BOOST_LOG_TRIVIAL(trace) << "TCP channel: Expecting " << reply_size_ << " bytes of reply";
    reply_.resize(reply_size_);
    boost::asio::async_read(socket_, boost::asio::buffer(reply_),
                            std::bind(&Exchange::handle_read_data, this,
                                      std::placeholders::_1,
                                      std::placeholders::_2));
  }

  void handle_read_data(const boost::system::error_code& ec, std::size_t bytes_transferred) {
    if (ec || bytes_transferred != reply_size_) {
      fail(NetworkError::CONNECTION_LOST, "Read failed: " + ec.message());
      return;
    }
    complete_ = true;
    error_ = NetworkError::SUCCESS;
    close();
  }

  void fail(NetworkError error, const std::string& message) {
    error_ = error;
    BOOST_LOG_TRIVIAL(warning) << "TCP channel: " << message;
    close();
  }
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TcpRequestChannel::TcpRequestChannel(const std::string& host, uint16_t port)
  : host_(host), port_(port) {
  BOOST_LOG_TRIVIAL(debug) << "TCP channel: Master endpoint " << host_ << ":" << port_;
}


//==============================================
// REQUEST OPERATIONS
//==============================================

std::string TcpRequestChannel::send(const std::string& kind, const std::string& payload,
                                    int tries, int timeout_seconds) {
  const std::string frame = build_frame(kind, payload);
  NetworkError last_error = NetworkError::TIMEOUT;

  for (int attempt = 1; attempt <= tries; ++attempt) {
    BOOST_LOG_TRIVIAL(debug) << "TCP channel: Sending " << kind << " request, try "
                             << attempt << " of " << tries;

    auto reply = exchange(frame, timeout_seconds, last_error);
    if (reply) {
      return *reply;
    }
    BOOST_LOG_TRIVIAL(warning) << "TCP channel: Try " << attempt << " failed: "
                               << network_error_to_string(last_error);
  }

  BOOST_LOG_TRIVIAL(error) << "TCP channel: Request to " << host_ << ":" << port_
                           << " failed after " << tries << " tries";
  throw TransportTimeoutError("Request to " + host_ + ":" + std::to_string(port_) + " timed out", last_error);
}

std::string TcpRequestChannel::build_frame(const std::string& kind, const std::string& payload) {
  if (kind.size() > UINT8_MAX) {
    throw std::invalid_argument("TCP channel: Request kind too long: " + kind);
  }

  const uint64_t size = boost::endian::native_to_big(
    static_cast<uint64_t>(1 + kind.size() + payload.size()));
  const auto kind_length = static_cast<char>(kind.size());

  std::string frame;
  frame.reserve(sizeof(size) + 1 + kind.size() + payload.size());
  frame.append(reinterpret_cast<const char*>(&size), sizeof(size));
  frame.push_back(kind_length);
  frame.append(kind);
  frame.append(payload);
  return frame;
}

std::optional<std::string> TcpRequestChannel::exchange(const std::string& frame, int timeout_seconds,
                                                       NetworkError& error) const {
  boost::asio::io_context io_context;
  Exchange exchange(io_context, frame);
  exchange.start(host_, port_);

  io_context.run_for(std::chrono::seconds(timeout_seconds));

  if (!exchange.is_complete()) {
    // Drop whatever is still pending, handlers are discarded with the context
    exchange.close();
    error = exchange.get_error();
    return std::nullopt;
  }

  error = NetworkError::SUCCESS;
  return std::move(exchange.get_reply());
}

} // namespace network
} // namespace fileclient
