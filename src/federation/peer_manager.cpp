#include "federation/peer_manager.hpp"
#include <algorithm>
#include <fstream>
#include <boost/log/trivial.hpp>

namespace magenc {
namespace federation {

namespace {

bool add_unique(std::vector<Peer>& peers, const Peer& peer) {
  if (std::find(peers.begin(), peers.end(), peer) != peers.end()) {
    return false;
  }
  peers.push_back(peer);
  return true;
}

std::string trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

} // namespace

PeerManager::PeerManager(PeerPolicy policy) : policy_(std::move(policy)) {
  BOOST_LOG_TRIVIAL(debug) << "Peer manager: Initialized"
                           << (policy_.has_allow_list() ? " with allow list" : "");
}


//==============================================
// PEER MANAGEMENT
//==============================================

bool PeerManager::add_push_peer(const Peer& peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!add_unique(push_peers_, peer)) {
    return false;
  }
  BOOST_LOG_TRIVIAL(info) << "Peer manager: Added push peer " << peer
                          << " (" << peer_status_to_string(policy_.classify(peer)) << ")";
  return true;
}

bool PeerManager::add_gossip_peer(const Peer& peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!add_unique(gossip_peers_, peer)) {
    return false;
  }
  BOOST_LOG_TRIVIAL(info) << "Peer manager: Added gossip peer " << peer
                          << " (" << peer_status_to_string(policy_.classify(peer)) << ")";
  return true;
}

bool PeerManager::remove_peer(const Peer& peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto before = push_peers_.size() + gossip_peers_.size();
  push_peers_.erase(std::remove(push_peers_.begin(), push_peers_.end(), peer), push_peers_.end());
  gossip_peers_.erase(std::remove(gossip_peers_.begin(), gossip_peers_.end(), peer), gossip_peers_.end());
  const bool removed = push_peers_.size() + gossip_peers_.size() != before;
  if (removed) {
    BOOST_LOG_TRIVIAL(info) << "Peer manager: Removed peer " << peer;
  }
  return removed;
}


//==============================================
// FEDERATION TARGETS
//==============================================

std::vector<Peer> PeerManager::push_targets() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return admitted(push_peers_);
}

std::vector<Peer> PeerManager::gossip_candidates() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return admitted(gossip_peers_);
}

std::vector<Peer> PeerManager::admitted(const std::vector<Peer>& peers) const {
  std::vector<Peer> result;
  for (const auto& peer : peers) {
    if (policy_.admits(peer)) {
      result.push_back(peer);
    } else {
      BOOST_LOG_TRIVIAL(trace) << "Peer manager: Skipping " << peer << " by policy";
    }
  }
  return result;
}


//==============================================
// ADMISSION
//==============================================

void PeerManager::admit_caller(const std::optional<Peer>& declared, const std::string& remote_host,
                               bool peer_request) const {
  const auto reason = policy_.reject_reason(declared, remote_host, peer_request);
  if (reason) {
    const std::string who = declared ? declared->base() : remote_host;
    BOOST_LOG_TRIVIAL(warning) << "Peer manager: Rejecting " << who << ": " << *reason;
    throw PeerRejected(who, *reason);
  }
}


//==============================================
// PEER FILES
//==============================================

std::vector<Peer> PeerManager::read_peers(std::istream& input) {
  std::vector<Peer> peers;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    const std::string text = trim(line);
    if (text.empty()) {
      continue;
    }
    auto peer = Peer::parse(text);
    if (!peer) {
      BOOST_LOG_TRIVIAL(warning) << "Peer manager: Skipping invalid peer URL on line "
                                 << line_number << ": " << text;
      continue;
    }
    add_unique(peers, *peer);
  }
  return peers;
}

std::vector<Peer> PeerManager::read_peer_file(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    throw FederationError("Peer manager: Cannot open peer file: " + path);
  }
  auto peers = read_peers(file);
  BOOST_LOG_TRIVIAL(info) << "Peer manager: Read " << peers.size() << " peer(s) from " << path;
  return peers;
}

void PeerManager::write_peers(const std::vector<Peer>& peers, std::ostream& output) {
  for (const auto& peer : peers) {
    output << peer.base() << '\n';
  }
}


//==============================================
// UTILITY METHODS
//==============================================

std::size_t PeerManager::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return push_peers_.size() + gossip_peers_.size();
}

} // namespace federation
} // namespace magenc
