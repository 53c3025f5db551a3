#ifndef MAGENC_FEDERATION_FEDERATION_ENGINE_HPP
#define MAGENC_FEDERATION_FEDERATION_ENGINE_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include <boost/asio/thread_pool.hpp>
#include "cid/cid.hpp"
#include "federation/peer.hpp"
#include "federation/peer_manager.hpp"
#include "federation/selection_policy.hpp"
#include "network/http_client.hpp"

namespace magenc {
namespace federation {

enum class GossipMode {
  PUSH,
  ANNOUNCE
};

// Throws FederationError for anything but "push" or "announce"
GossipMode gossip_mode_from_string(const std::string& text);
const char* gossip_mode_to_string(GossipMode mode);

// What a peer is told about a new object
struct Notification {
  enum class Kind {
    PUSH,       // POST the bytes to <peer>/
    ANNOUNCE    // POST the CID text to <peer>/notify
  };

  Kind kind;
  cid::Cid cid;
  std::shared_ptr<const std::string> bytes;   // PUSH only

  static Notification push(const cid::Cid& cid, std::shared_ptr<const std::string> bytes);
  static Notification announce(const cid::Cid& cid);
};

struct FederationOptions {
  std::string self_url;          // sent as X-Magenc-Peer, may be empty
  std::size_t fanout{3};
  GossipMode gossip_mode{GossipMode::PUSH};
  std::size_t threads{2};
};

// Fire-and-forget delivery of new objects to other nodes. Work runs on a
// Boost.Asio thread pool; failures are logged and never retried.
class FederationEngine {
public:
  static constexpr const char* PEER_HEADER = "X-Magenc-Peer";
  static constexpr const char* CID_HEADER = "Content-CID";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  FederationEngine(network::HttpClient& client, PeerManager& peers, FederationOptions options);
  ~FederationEngine();

  FederationEngine(const FederationEngine&) = delete;
  FederationEngine& operator=(const FederationEngine&) = delete;


  // ---- FEDERATION OPERATIONS ----
  // Pushes to every push target and gossips to a random subset of the
  // gossip candidates
  void federate(const cid::Cid& cid, std::shared_ptr<const std::string> bytes);
  // Queues one delivery per selected peer and returns the selection
  std::vector<Peer> notify_peer_set(const std::vector<Peer>& peers, const SelectionPolicy& policy,
                                    const Notification& notification);
  // Runs a task on the federation pool
  void run_in_background(std::function<void()> task);


  // ---- LIFECYCLE ----
  // Blocks until every queued task has finished
  void wait_idle();
  void shutdown();


  // ---- GETTERS ----
  const FederationOptions& options() const { return options_; }
  PeerManager& peers() { return peers_; }

private:
  void deliver(const Peer& peer, const Notification& notification);
  network::Headers peer_headers() const;

  // ---- PARAMETERS ----
  network::HttpClient& client_;
  PeerManager& peers_;
  const FederationOptions options_;

  boost::asio::thread_pool pool_;
  bool is_running_;

  std::mt19937 rng_;
  std::mutex rng_mutex_;

  // Outstanding tasks
  std::size_t pending_;
  std::mutex pending_mutex_;
  std::condition_variable idle_cv_;
};

} // namespace federation
} // namespace magenc

#endif // MAGENC_FEDERATION_FEDERATION_ENGINE_HPP
