// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "membership/membership_manager.hpp"
#include "network/gossip.hpp"
#include "network/local_discovery.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <boost/asio/post.hpp>

namespace peerwatch {
namespace membership {

namespace {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

MembershipManager::MembershipManager(boost::asio::io_context &io_context,
                                     std::string local_peer_id, network::GossipChannel &gossip,
                                     network::Dht &dht, Directory &directory, const Config &config)
    : io_context_(io_context), local_peer_id_(std::move(local_peer_id)), gossip_(gossip),
      config_(config), heartbeat_(local_peer_id_, config_.topic, gossip, dht, directory),
      gossip_ingest_(directory), discovery_ingest_(local_peer_id_, dht, directory),
      anti_entropy_(directory, dht, config_.peer_ttl,
                    [this](DhtLookupResult result) { Post(std::move(result)); }) {}

MembershipManager::~MembershipManager() { stop(); }

bool MembershipManager::start() {
  if (running_.exchange(true)) {
    return false;
  }

  gossip_.subscribe(config_.topic);
  gossip_.set_message_callback([this](const network::GossipDelivery &delivery) {
    if (delivery.topic != config_.topic) {
      return;
    }
    Post(GossipMessage{delivery.origin, delivery.data});
  });

  heartbeat_timer_ = std::make_unique<boost::asio::steady_timer>(io_context_);
  anti_entropy_timer_ = std::make_unique<boost::asio::steady_timer>(io_context_);

  LOG_MEMBER_INFO("configured intervals: heartbeat={}s, anti-entropy={}s, peer ttl={}s",
                  config_.heartbeat_interval.count(), config_.anti_entropy_interval.count(),
                  config_.peer_ttl);

  const auto now = std::chrono::steady_clock::now();
  schedule_heartbeat(now);
  schedule_anti_entropy(now);
  return true;
}

void MembershipManager::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  if (heartbeat_timer_) {
    heartbeat_timer_->cancel();
  }
  if (anti_entropy_timer_) {
    anti_entropy_timer_->cancel();
  }
  gossip_.set_message_callback({});
}

void MembershipManager::Post(Event event) {
  boost::asio::post(io_context_, [this, event = std::move(event)]() {
    if (!running_.load()) {
      return;
    }
    HandleEvent(event);
  });
}

void MembershipManager::OnDiscovered(const network::DiscoveredPeer &peer) {
  Post(DiscoveryEvent{peer.peer_id, peer.endpoint});
}

void MembershipManager::HandleEvent(const Event &event) {
  std::visit(Overloaded{
                 [this](const GossipMessage &msg) { gossip_ingest_.Handle(msg); },
                 [this](const DiscoveryEvent &ev) {
                   discovery_ingest_.Handle(ev, util::GetUnixSeconds());
                 },
                 [this](const DhtLookupResult &result) { anti_entropy_.HandleResult(result); },
                 [this](const HeartbeatTick &) { heartbeat_.Publish(util::GetUnixSeconds()); },
                 [this](const AntiEntropyTick &) { anti_entropy_.RunPass(util::GetUnixSeconds()); },
             },
             event);
}

void MembershipManager::schedule_heartbeat(std::chrono::steady_clock::time_point when) {
  heartbeat_timer_->expires_at(when);
  heartbeat_timer_->async_wait([this, when](const boost::system::error_code &ec) {
    if (ec || !running_.load()) {
      return;
    }
    HandleEvent(HeartbeatTick{});
    schedule_heartbeat(when + config_.heartbeat_interval);
  });
}

void MembershipManager::schedule_anti_entropy(std::chrono::steady_clock::time_point when) {
  anti_entropy_timer_->expires_at(when);
  anti_entropy_timer_->async_wait([this, when](const boost::system::error_code &ec) {
    if (ec || !running_.load()) {
      return;
    }
    HandleEvent(AntiEntropyTick{});
    schedule_anti_entropy(when + config_.anti_entropy_interval);
  });
}

} // namespace membership
} // namespace peerwatch
