// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_MESSAGE_ROUTER_HPP
#define CHAINCRAFT_MESSAGE_ROUTER_HPP

#include "network/message.hpp"
#include "network/peer.hpp"
#include <memory>

namespace chaincraft {

namespace gossip {
class GossipEngine;
}

namespace network {

class PeerManager;

// MessageRouter - hands post-handshake messages to their owner
//   announce / request / object -> GossipEngine
//   getpeers / peers            -> PeerManager
// Handshake and keep-alive messages never get here; Peer consumes them.
class MessageRouter {
public:
  MessageRouter(PeerManager *peer_mgr, gossip::GossipEngine *gossip);

  // False for messages nobody handles (counted as a protocol violation)
  bool RouteMessage(PeerPtr peer, std::unique_ptr<message::Message> msg);

private:
  PeerManager *peer_manager_;
  gossip::GossipEngine *gossip_;
};

} // namespace network
} // namespace chaincraft

#endif // CHAINCRAFT_MESSAGE_ROUTER_HPP
