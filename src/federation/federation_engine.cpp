#include "federation/federation_engine.hpp"
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>
#include "federation/federation_error.hpp"

namespace magenc {
namespace federation {

GossipMode gossip_mode_from_string(const std::string& text) {
  if (text == "push") {
    return GossipMode::PUSH;
  }
  if (text == "announce") {
    return GossipMode::ANNOUNCE;
  }
  throw FederationError("Unknown gossip mode: " + text);
}

const char* gossip_mode_to_string(GossipMode mode) {
  switch (mode) {
    case GossipMode::PUSH: return "push";
    case GossipMode::ANNOUNCE: return "announce";
    default: return "unknown";
  }
}

Notification Notification::push(const cid::Cid& cid, std::shared_ptr<const std::string> bytes) {
  return Notification{Kind::PUSH, cid, std::move(bytes)};
}

Notification Notification::announce(const cid::Cid& cid) {
  return Notification{Kind::ANNOUNCE, cid, nullptr};
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FederationEngine::FederationEngine(network::HttpClient& client, PeerManager& peers,
                                   FederationOptions options)
  : client_(client)
  , peers_(peers)
  , options_(std::move(options))
  , pool_(options_.threads > 0 ? options_.threads : 1)
  , is_running_(true)
  , rng_(std::random_device{}())
  , pending_(0) {
  BOOST_LOG_TRIVIAL(info) << "Federation: Started with fan-out " << options_.fanout
                          << ", gossip mode " << gossip_mode_to_string(options_.gossip_mode)
                          << ", " << (options_.threads > 0 ? options_.threads : 1) << " thread(s)";
}

FederationEngine::~FederationEngine() {
  shutdown();
}


//==============================================
// FEDERATION OPERATIONS
//==============================================

void FederationEngine::federate(const cid::Cid& cid, std::shared_ptr<const std::string> bytes) {
  const auto push_targets = peers_.push_targets();
  if (!push_targets.empty()) {
    notify_peer_set(push_targets, AllPeers{}, Notification::push(cid, bytes));
  }

  const auto gossip = peers_.gossip_candidates();
  if (gossip.empty() || options_.fanout == 0) {
    return;
  }
  const Notification notification = options_.gossip_mode == GossipMode::PUSH
    ? Notification::push(cid, bytes)
    : Notification::announce(cid);
  notify_peer_set(gossip, RandomSubset{options_.fanout}, notification);
}

std::vector<Peer> FederationEngine::notify_peer_set(const std::vector<Peer>& peers,
                                                    const SelectionPolicy& policy,
                                                    const Notification& notification) {
  std::vector<Peer> selected;
  {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    selected = select_peers(peers, policy, rng_);
  }

  BOOST_LOG_TRIVIAL(debug) << "Federation: Notifying " << selected.size() << " of " << peers.size()
                           << " peer(s) (" << describe(policy) << ") about " << notification.cid;

  for (const auto& peer : selected) {
    run_in_background([this, peer, notification]() { deliver(peer, notification); });
  }
  return selected;
}

void FederationEngine::run_in_background(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (!is_running_) {
      BOOST_LOG_TRIVIAL(warning) << "Federation: Dropping task after shutdown";
      return;
    }
    ++pending_;
  }

  boost::asio::post(pool_, [this, task = std::move(task)]() {
    try {
      task();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Federation: Background task failed: " << e.what();
    }
    {
      std::lock_guard<std::mutex> lock(pending_mutex_);
      --pending_;
    }
    idle_cv_.notify_all();
  });
}

void FederationEngine::deliver(const Peer& peer, const Notification& notification) {
  network::Headers headers = peer_headers();
  network::HttpResult result;

  if (notification.kind == Notification::Kind::PUSH) {
    headers[CID_HEADER] = notification.cid.encode();
    result = client_.post(peer.base() + "/", *notification.bytes, headers);
  } else {
    if (options_.self_url.empty()) {
      BOOST_LOG_TRIVIAL(warning) << "Federation: Cannot announce to " << peer
                                 << " without a self URL";
      return;
    }
    result = client_.post(peer.base() + "/notify", notification.cid.encode(), headers);
  }

  if (result.ok()) {
    BOOST_LOG_TRIVIAL(info) << "Federation: Delivered " << notification.cid << " to " << peer;
  } else {
    BOOST_LOG_TRIVIAL(warning) << "Federation: Delivery of " << notification.cid << " to " << peer
                               << " failed: " << result.describe();
  }
}

network::Headers FederationEngine::peer_headers() const {
  network::Headers headers;
  if (!options_.self_url.empty()) {
    headers[PEER_HEADER] = options_.self_url;
  }
  return headers;
}


//==============================================
// LIFECYCLE
//==============================================

void FederationEngine::wait_idle() {
  std::unique_lock<std::mutex> lock(pending_mutex_);
  idle_cv_.wait(lock, [this] { return pending_ == 0; });
}

void FederationEngine::shutdown() {
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (!is_running_) {
      return;
    }
    is_running_ = false;
  }
  BOOST_LOG_TRIVIAL(info) << "Federation: Waiting for outstanding deliveries";
  pool_.join();
  BOOST_LOG_TRIVIAL(info) << "Federation: Shutdown complete";
}

} // namespace federation
} // namespace magenc
