// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "network/message_router.hpp"
#include "gossip/gossip_engine.hpp"
#include "network/peer_manager.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"

namespace chaincraft {
namespace network {

MessageRouter::MessageRouter(PeerManager *peer_mgr, gossip::GossipEngine *gossip)
    : peer_manager_(peer_mgr), gossip_(gossip) {}

bool MessageRouter::RouteMessage(PeerPtr peer,
                                 std::unique_ptr<message::Message> msg) {
  if (!msg || !peer) {
    return false;
  }

  const std::string command = msg->command();
  LOG_NET_TRACE("MessageRouter: routing peer={} command={}", peer->id(), command);

  if (command == protocol::commands::ANNOUNCE ||
      command == protocol::commands::REQUEST ||
      command == protocol::commands::OBJECT) {
    if (!gossip_) {
      return false;
    }
    return gossip_->on_receive(peer, std::move(msg));
  }

  if (command == protocol::commands::GETPEERS) {
    if (!peer_manager_) {
      return false;
    }
    peer_manager_->handle_getpeers(peer);
    return true;
  }

  if (command == protocol::commands::PEERS) {
    auto *peers_msg = dynamic_cast<message::PeersMessage *>(msg.get());
    if (!peers_msg) {
      LOG_NET_ERROR("MessageRouter: bad payload type for PEERS from peer {}",
                    peer->id());
      return false;
    }
    if (!peer_manager_) {
      return false;
    }
    peer_manager_->handle_peers(peer, *peers_msg);
    return true;
  }

  LOG_NET_WARN("MessageRouter: unexpected {} from peer={}", command, peer->id());
  if (peer_manager_) {
    peer_manager_->ReportProtocolViolation(peer->id(),
                                           "unexpected " + command + " message");
  }
  return false;
}

} // namespace network
} // namespace chaincraft
