#ifndef MAGENC_FEDERATION_PEER_MANAGER_HPP
#define MAGENC_FEDERATION_PEER_MANAGER_HPP

#include <istream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "federation/federation_error.hpp"
#include "federation/peer.hpp"
#include "federation/peer_policy.hpp"

namespace magenc {
namespace federation {

// Push and gossip peer sets plus the policy that filters them
class PeerManager {
public:
  // Delete copy constructor and assignment operator
  PeerManager(const PeerManager&) = delete;
  PeerManager& operator=(const PeerManager&) = delete;


  // ---- CONSTRUCTOR ----
  explicit PeerManager(PeerPolicy policy = PeerPolicy());


  // ---- PEER MANAGEMENT ----
  // Return false when a peer with the same origin is already listed
  bool add_push_peer(const Peer& peer);
  bool add_gossip_peer(const Peer& peer);
  // Removes the peer from both sets
  bool remove_peer(const Peer& peer);


  // ---- FEDERATION TARGETS ----
  // Listed peers the policy admits
  std::vector<Peer> push_targets() const;
  std::vector<Peer> gossip_candidates() const;


  // ---- ADMISSION ----
  // Throws PeerRejected
  void admit_caller(const std::optional<Peer>& declared, const std::string& remote_host,
                    bool peer_request) const;
  const PeerPolicy& policy() const { return policy_; }


  // ---- PEER FILES ----
  // Line-delimited URLs; blank lines are skipped, invalid ones logged and skipped
  static std::vector<Peer> read_peers(std::istream& input);
  // Throws FederationError when the file cannot be opened
  static std::vector<Peer> read_peer_file(const std::string& path);
  static void write_peers(const std::vector<Peer>& peers, std::ostream& output);


  // ---- UTILITY METHODS ----
  std::size_t size() const;

private:
  std::vector<Peer> admitted(const std::vector<Peer>& peers) const;

  // ---- PARAMETERS ----
  const PeerPolicy policy_;

  // Peer sets and access mutex
  std::vector<Peer> push_peers_;
  std::vector<Peer> gossip_peers_;
  mutable std::mutex mutex_;
};

} // namespace federation
} // namespace magenc

#endif // MAGENC_FEDERATION_PEER_MANAGER_HPP
