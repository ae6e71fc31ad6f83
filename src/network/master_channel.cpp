#include "network/master_channel.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace fileclient {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

MasterChannel::MasterChannel(std::unique_ptr<RequestChannel> channel,
                             std::unique_ptr<crypto::Crypticle> crypticle,
                             int tries, int timeout_seconds)
  : channel_(std::move(channel)),
    crypticle_(std::move(crypticle)),
    tries_(tries),
    timeout_seconds_(timeout_seconds) {
  if (!channel_ || !crypticle_) {
    throw std::invalid_argument("Master channel: Channel and crypticle are required");
  }
  BOOST_LOG_TRIVIAL(debug) << "Master channel: Initialized with " << tries_
                           << " tries, " << timeout_seconds_ << "s timeout";
}


//==============================================
// REQUEST OPERATIONS
//==============================================

Load MasterChannel::query(const Load& request) {
  const std::string command = request.get_string("cmd");
  BOOST_LOG_TRIVIAL(trace) << "Master channel: Sending " << command;

  const std::string payload = crypticle_->encrypt(codec_.serialize(request));
  const std::string reply = channel_->send(REQUEST_KIND, payload, tries_, timeout_seconds_);

  Load load = codec_.deserialize(crypticle_->decrypt(reply));
  BOOST_LOG_TRIVIAL(trace) << "Master channel: Reply to " << command << " carries "
                           << load.size() << " fields";
  return load;
}

} // namespace network
} // namespace fileclient
