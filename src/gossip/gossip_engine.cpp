// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "gossip/gossip_engine.hpp"
#include "network/peer_manager.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace chaincraft {
namespace gossip {

using message::AnnounceMessage;
using message::ObjectMessage;
using message::RequestMessage;

GossipEngine::GossipEngine(network::PeerManager &peer_manager,
                           consensus::ConsensusEngine &consensus,
                           storage::ObjectStore &store,
                           const crypto::CryptoProvider &crypto,
                           DedupCache &dedup, const Config &config)
    : peer_manager_(peer_manager), consensus_(consensus), store_(store),
      crypto_(crypto), dedup_(dedup), config_(config),
      deferred_(config.deferred) {}

GossipEngine::~GossipEngine() { stop(); }

bool GossipEngine::start() {
  if (running_.exchange(true)) {
    return false;
  }
  if (config_.worker_threads > 0) {
    std::lock_guard<std::mutex> lock(lanes_mutex_);
    pool_ = std::make_unique<util::ThreadPool>(config_.worker_threads);
  }
  LOG_GOSSIP_DEBUG("gossip engine started ({} workers, validator {})",
                   config_.worker_threads, consensus_.validator().name());
  return true;
}

void GossipEngine::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  std::unique_ptr<util::ThreadPool> pool;
  {
    std::lock_guard<std::mutex> lock(lanes_mutex_);
    pool = std::move(pool_);
  }
  // ThreadPool's destructor runs every queued drain before joining
  pool.reset();

  std::lock_guard<std::mutex> lock(lanes_mutex_);
  lanes_.clear();
  LOG_GOSSIP_DEBUG("gossip engine stopped");
}

void GossipEngine::set_fatal_error_callback(FatalErrorCallback cb) {
  std::lock_guard<std::mutex> lock(fatal_mutex_);
  fatal_cb_ = std::move(cb);
}

void GossipEngine::report_fatal(const std::string &what) {
  if (fatal_.exchange(true)) {
    return;
  }
  LOG_GOSSIP_ERROR("object store unavailable, halting gossip: {}", what);
  FatalErrorCallback cb;
  {
    std::lock_guard<std::mutex> lock(fatal_mutex_);
    cb = fatal_cb_;
  }
  if (cb) {
    cb(what);
  }
}

bool GossipEngine::on_receive(network::PeerPtr from,
                              std::unique_ptr<message::Message> msg) {
  if (!from || !msg) {
    return false;
  }
  const std::string command = msg->command();

  LaneTask task;
  if (command == protocol::commands::OBJECT) {
    auto *object_msg = dynamic_cast<ObjectMessage *>(msg.get());
    if (!object_msg) {
      LOG_GOSSIP_ERROR("bad payload type for OBJECT from peer={}", from->id());
      return false;
    }
    if (!running_ || fatal_) {
      return true;
    }
    task.object = admit_object(from, *object_msg);
    if (!task.object) {
      return true;
    }
  } else if (command == protocol::commands::ANNOUNCE ||
             command == protocol::commands::REQUEST) {
    if (!running_ || fatal_) {
      return true;
    }
    task.msg = std::move(msg);
  } else {
    return false;
  }

  if (config_.worker_threads == 0) {
    process_task(from, task);
  } else {
    enqueue(from, std::move(task));
  }
  return true;
}

primitives::SharedObjectPtr
GossipEngine::admit_object(const network::PeerPtr &from,
                           const ObjectMessage &msg) {
  stats_.objects_received.fetch_add(1, std::memory_order_relaxed);

  primitives::Digest actual = crypto_.hash(msg.payload);
  if (actual != msg.digest) {
    stats_.integrity_failures.fetch_add(1, std::memory_order_relaxed);
    LOG_GOSSIP_WARN("digest mismatch from peer={}: claimed {} actual {}",
                    from->id(), msg.digest.ToShortString(),
                    actual.ToShortString());
    peer_manager_.ReportIntegrityViolation(from->id(), "object digest mismatch");
    return nullptr;
  }

  if (!dedup_.insert(actual)) {
    stats_.duplicates.fetch_add(1, std::memory_order_relaxed);
    LOG_GOSSIP_TRACE("duplicate object {} from peer={}", actual.ToShortString(),
                     from->id());
    return nullptr;
  }

  from->mark_useful();
  return primitives::MakeSharedObject(actual, msg.kind, msg.payload, from->id(),
                                      util::GetTime());
}

void GossipEngine::enqueue(const network::PeerPtr &from, LaneTask task) {
  const PeerId id = from->id();
  std::deque<LaneTask> cancelled;
  {
    std::lock_guard<std::mutex> lock(lanes_mutex_);
    Lane &lane = lanes_[id];
    if (lane.peer != from) {
      // First message on this connection; anything left belongs to an old one
      cancelled = std::move(lane.tasks);
      lane.tasks.clear();
      lane.peer = from;
      lane.generation = next_generation_++;
      lane.draining = false;
    }
    lane.tasks.push_back(std::move(task));

    if (!lane.draining) {
      if (!pool_) {
        // Stopped between on_receive's check and here
        cancelled.push_back(std::move(lane.tasks.back()));
        lane.tasks.pop_back();
      } else {
        lane.draining = true;
        uint64_t generation = lane.generation;
        pool_->enqueue([this, id, generation]() { drain_lane(id, generation); });
      }
    }
  }

  for (auto &t : cancelled) {
    if (t.object) {
      dedup_.erase(t.object->digest);
    }
    stats_.lane_tasks_cancelled.fetch_add(1, std::memory_order_relaxed);
  }
}

void GossipEngine::drain_lane(PeerId peer_id, uint64_t generation) {
  while (true) {
    LaneTask task;
    network::PeerPtr peer;
    {
      std::lock_guard<std::mutex> lock(lanes_mutex_);
      auto it = lanes_.find(peer_id);
      if (it == lanes_.end() || it->second.generation != generation) {
        return;
      }
      Lane &lane = it->second;
      if (lane.tasks.empty()) {
        lane.draining = false;
        return;
      }
      task = std::move(lane.tasks.front());
      lane.tasks.pop_front();
      peer = lane.peer;
    }
    process_task(peer, task);
  }
}

void GossipEngine::on_peer_disconnected(PeerId peer_id) {
  std::deque<LaneTask> cancelled;
  {
    std::lock_guard<std::mutex> lock(lanes_mutex_);
    auto it = lanes_.find(peer_id);
    if (it == lanes_.end()) {
      return;
    }
    cancelled = std::move(it->second.tasks);
    lanes_.erase(it);
  }

  size_t forgotten = 0;
  for (auto &t : cancelled) {
    if (t.object && dedup_.erase(t.object->digest)) {
      ++forgotten;
    }
  }
  stats_.lane_tasks_cancelled.fetch_add(cancelled.size(),
                                        std::memory_order_relaxed);
  if (!cancelled.empty()) {
    LOG_GOSSIP_DEBUG("peer={} gone: cancelled {} queued messages ({} objects "
                     "forgotten)",
                     peer_id, cancelled.size(), forgotten);
  }
}

size_t GossipEngine::lane_count() const {
  std::lock_guard<std::mutex> lock(lanes_mutex_);
  return lanes_.size();
}

void GossipEngine::process_task(const network::PeerPtr &from, LaneTask &task) {
  if (fatal_) {
    return;
  }
  try {
    if (task.object) {
      validate_object(task.object);
      return;
    }
    if (auto *announce = dynamic_cast<AnnounceMessage *>(task.msg.get())) {
      handle_announce(from, *announce);
    } else if (auto *request = dynamic_cast<RequestMessage *>(task.msg.get())) {
      handle_request(from, *request);
    }
  } catch (const storage::StoreUnavailableError &e) {
    report_fatal(e.what());
  }
}

void GossipEngine::handle_announce(const network::PeerPtr &from,
                                   const AnnounceMessage &msg) {
  if (dedup_.contains(msg.digest) || store_.contains(msg.digest)) {
    LOG_GOSSIP_TRACE("announce of known {} from peer={}",
                     msg.digest.ToShortString(), from->id());
    return;
  }
  from->mark_useful();
  if (send_to(from, std::make_unique<RequestMessage>(msg.digest)) ==
      network::SendResult::Sent) {
    stats_.requests_sent.fetch_add(1, std::memory_order_relaxed);
  }
}

void GossipEngine::handle_request(const network::PeerPtr &from,
                                  const RequestMessage &msg) {
  auto payload = store_.get(msg.digest);
  if (!payload) {
    LOG_GOSSIP_TRACE("peer={} requested unknown {}", from->id(),
                     msg.digest.ToShortString());
    return;
  }
  auto reply = std::make_unique<ObjectMessage>();
  reply->digest = msg.digest;
  reply->kind =
      consensus_.kind_of(msg.digest).value_or(primitives::ObjectKind::Custom);
  reply->payload = std::move(*payload);
  if (send_to(from, std::move(reply)) == network::SendResult::Sent) {
    stats_.objects_served.fetch_add(1, std::memory_order_relaxed);
  }
}

void GossipEngine::validate_object(const primitives::SharedObjectPtr &object) {
  consensus::ConsensusDecision decision = consensus_.submit(*object);
  std::deque<primitives::Digest> unlocked;
  apply_decision(object, decision, 0, unlocked);
  release_dependents(unlocked);
}

void GossipEngine::on_consensus_result(
    const primitives::SharedObjectPtr &object,
    const consensus::ConsensusDecision &decision) {
  try {
    std::deque<primitives::Digest> unlocked;
    apply_decision(object, decision, 0, unlocked);
    release_dependents(unlocked);
  } catch (const storage::StoreUnavailableError &e) {
    report_fatal(e.what());
  }
}

void GossipEngine::apply_decision(const primitives::SharedObjectPtr &object,
                                  const consensus::ConsensusDecision &decision,
                                  uint32_t attempt,
                                  std::deque<primitives::Digest> &unlocked) {
  const primitives::Digest &digest = object->digest;
  const PeerId origin = object->origin_peer.value_or(NO_PEER_ID);

  switch (decision.outcome) {
  case consensus::ConsensusDecision::Outcome::Accepted:
    store_.put(digest, object->payload);
    stats_.accepted.fetch_add(1, std::memory_order_relaxed);
    LOG_GOSSIP_DEBUG("accepted {} ({}, order {}) from peer={}",
                     digest.ToShortString(), primitives::ObjectKindName(object->kind),
                     decision.order_index, origin);
    announce(object);
    unlocked.push_back(digest);
    break;

  case consensus::ConsensusDecision::Outcome::Rejected:
    stats_.rejected.fetch_add(1, std::memory_order_relaxed);
    LOG_GOSSIP_DEBUG("rejected {} from peer={}: {}", digest.ToShortString(),
                     origin, decision.reason);
    break;

  case consensus::ConsensusDecision::Outcome::Deferred: {
    auto result = deferred_.park(object, decision.missing_dependency, attempt);
    if (result == DeferredPool::ParkResult::Parked) {
      stats_.deferred.fetch_add(1, std::memory_order_relaxed);
      LOG_GOSSIP_DEBUG("deferred {} until {} is committed (attempt {})",
                       digest.ToShortString(),
                       decision.missing_dependency.ToShortString(), attempt);
      request_dependency(object, decision.missing_dependency);
      // The dependency may have been committed by another lane meanwhile
      if (consensus_.is_committed(decision.missing_dependency)) {
        unlocked.push_back(decision.missing_dependency);
      }
    } else if (result != DeferredPool::ParkResult::AlreadyParked) {
      stats_.deferred_dropped.fetch_add(1, std::memory_order_relaxed);
      LOG_GOSSIP_WARN("dropping deferred object {} waiting on {}: {}",
                      digest.ToShortString(),
                      decision.missing_dependency.ToShortString(),
                      ParkResultName(result));
      dedup_.erase(digest);
    }
    break;
  }
  }
}

void GossipEngine::release_dependents(std::deque<primitives::Digest> &unlocked) {
  while (!unlocked.empty() && !fatal_) {
    primitives::Digest dependency = unlocked.front();
    unlocked.pop_front();
    for (auto &entry : deferred_.release(dependency)) {
      consensus::ConsensusDecision decision = consensus_.submit(*entry.object);
      // Waiting on a new dependency is progress; only a repeat counts
      uint32_t attempt = entry.attempt;
      if (decision.deferred() && decision.missing_dependency == entry.missing) {
        ++attempt;
      }
      apply_decision(entry.object, decision, attempt, unlocked);
    }
  }
}

void GossipEngine::announce(const primitives::SharedObjectPtr &object) {
  const PeerId origin = object->origin_peer.value_or(NO_PEER_ID);
  for (const auto &peer : peer_manager_.get_connected_peers()) {
    if (peer->id() == origin) {
      continue;
    }
    if (send_to(peer, std::make_unique<AnnounceMessage>(object->digest)) ==
        network::SendResult::Sent) {
      stats_.announcements_sent.fetch_add(1, std::memory_order_relaxed);
    }
  }
}

void GossipEngine::request_dependency(const primitives::SharedObjectPtr &object,
                                      const primitives::Digest &missing) {
  if (!object->origin_peer || object->is_local()) {
    return;
  }
  // Already received and waiting for validation
  if (dedup_.contains(missing)) {
    return;
  }
  auto peer = peer_manager_.get_peer(*object->origin_peer);
  if (!peer || peer->state() != network::PeerState::READY) {
    return;
  }
  if (send_to(peer, std::make_unique<RequestMessage>(missing)) ==
      network::SendResult::Sent) {
    stats_.requests_sent.fetch_add(1, std::memory_order_relaxed);
  }
}

network::SendResult
GossipEngine::send_to(const network::PeerPtr &peer,
                      std::unique_ptr<message::Message> msg) {
  network::SendResult result = peer->send_message(std::move(msg));
  if (result == network::SendResult::QueueFull) {
    stats_.send_queue_drops.fetch_add(1, std::memory_order_relaxed);
    peer_manager_.ReportSendQueueFull(peer->id());
  }
  return result;
}

primitives::Digest GossipEngine::submit_local(std::vector<uint8_t> payload,
                                              primitives::ObjectKind kind) {
  primitives::Digest digest = crypto_.hash(payload);
  if (fatal_) {
    LOG_GOSSIP_WARN("ignoring local submit of {}: node halted",
                    digest.ToShortString());
    return digest;
  }
  if (!dedup_.insert(digest)) {
    stats_.duplicates.fetch_add(1, std::memory_order_relaxed);
    LOG_GOSSIP_DEBUG("local submit of known object {}", digest.ToShortString());
    return digest;
  }

  auto object = primitives::MakeSharedObject(digest, kind, std::move(payload),
                                             LOCAL_PEER_ID, util::GetTime());
  try {
    validate_object(object);
  } catch (const storage::StoreUnavailableError &e) {
    report_fatal(e.what());
  }
  return digest;
}

void GossipEngine::maintenance() {
  for (const auto &entry : deferred_.expire()) {
    stats_.deferred_dropped.fetch_add(1, std::memory_order_relaxed);
    LOG_GOSSIP_WARN("deferred object {} expired waiting on {}",
                    entry.object->digest.ToShortString(),
                    entry.missing.ToShortString());
    dedup_.erase(entry.object->digest);
  }
  dedup_.prune();
}

} // namespace gossip
} // namespace chaincraft
