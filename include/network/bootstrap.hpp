#pragma once

#include <memory>
#include <string>
#include <vector>
#include "config/config.hpp"
#include "federation/federation_engine.hpp"
#include "federation/peer_manager.hpp"
#include "fetch/fetcher.hpp"
#include "file_server/file_server.hpp"
#include "network/http_client.hpp"
#include "network/http_server.hpp"
#include "store/store.hpp"

namespace magenc {
namespace network {

// Builds and owns every node component from a NodeConfig
class Bootstrap {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Bootstrap(const config::NodeConfig& config);
  // Uses the given client for fetches and federation instead of Beast
  Bootstrap(const config::NodeConfig& config, std::unique_ptr<HttpClient> client);
  ~Bootstrap();

  Bootstrap(const Bootstrap&) = delete;
  Bootstrap& operator=(const Bootstrap&) = delete;


  // ---- INITIALIZATION AND DESTRUCTION METHODS ----
  // Starts the HTTP listener
  bool start();
  // Stops the listener, then drains federation
  bool shutdown();


  // ---- GETTERS AND SETTERS ----
  store::Store& get_store() { return *store_; }
  federation::PeerManager& get_peer_manager() { return *peer_manager_; }
  federation::FederationEngine& get_federation() { return *federation_; }
  fetch::Fetcher& get_fetcher() { return *fetcher_; }
  file_server::FileServer& get_file_server() { return *file_server_; }
  HttpServer& get_http_server() { return *http_server_; }

private:
  // Combines inline peers with the ones read from peer files
  static std::vector<federation::Peer> collect_peers(const std::vector<std::string>& urls,
                                                     const std::string& file);
  federation::PeerPolicy build_policy() const;

  // ---- PARAMETERS ----
  const config::NodeConfig config_;

  // System components
  std::unique_ptr<store::Store> store_;
  std::unique_ptr<HttpClient> http_client_;
  std::unique_ptr<federation::PeerManager> peer_manager_;
  std::unique_ptr<federation::FederationEngine> federation_;
  std::unique_ptr<fetch::Fetcher> fetcher_;
  std::unique_ptr<file_server::FileServer> file_server_;
  std::unique_ptr<HttpServer> http_server_;
};

} // namespace network
} // namespace magenc
