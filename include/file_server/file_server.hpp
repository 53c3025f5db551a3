#ifndef MAGENC_FILE_SERVER_HPP
#define MAGENC_FILE_SERVER_HPP

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include "cid/cid.hpp"
#include "federation/federation_engine.hpp"
#include "federation/peer_manager.hpp"
#include "fetch/fetcher.hpp"
#include "network/http_client.hpp"
#include "store/store.hpp"

namespace magenc {
namespace file_server {

// Transport-neutral view of an HTTP request
struct Request {
  std::string method;
  std::string target;
  std::string body;
  network::Headers headers;   // names lowercased
  std::string remote_host;

  std::optional<std::string> header(const std::string& name) const;
};

struct Response {
  unsigned status{200};
  std::string body;
  network::Headers headers;
  // Set for HEAD answers, which carry the length of the omitted body
  std::optional<std::uint64_t> content_length;
};

struct FileServerOptions {
  bool allow_post{false};
};

// Serves the store over HTTP semantics and hands new objects to the
// federation engine
class FileServer {
public:
  // ---- CONSTRUCTOR ----
  FileServer(store::Store& store, federation::PeerManager& peers,
             federation::FederationEngine& federation, fetch::Fetcher& fetcher,
             FileServerOptions options);


  // ---- PROCESSING OF HTTP REQUESTS ----
  // Never throws; every failure is mapped to a status
  Response handle(const Request& request);


  // ---- PROCESSING OF LOCAL REQUESTS ----
  // Stores bytes and federates them when they are new
  cid::Cid store_file(std::istream& input);
  std::string get_file(const cid::Cid& cid) const;


  // ---- GETTERS ----
  store::Store& get_store() { return store_; }
  const FileServerOptions& options() const { return options_; }

private:
  // ---- PARAMETERS ----
  store::Store& store_;
  federation::PeerManager& peers_;
  federation::FederationEngine& federation_;
  fetch::Fetcher& fetcher_;
  const FileServerOptions options_;


  // ---- ROUTES ----
  Response handle_index(const Request& request, bool head);
  Response handle_get(const std::string& cid_text, bool head);
  Response handle_gateway(const std::string& link_text, bool head);
  Response handle_post(const Request& request);
  Response handle_notify(const Request& request);


  // ---- SUPPORT ----
  // Parses X-Magenc-Peer. Throws std::invalid_argument when it is present but malformed.
  std::optional<federation::Peer> declared_peer(const Request& request) const;
  // Fetches an announced object from its announcer, then stores and federates it
  void pull_announced(const federation::Peer& announcer, const cid::Cid& cid);
  // Verified stored bytes, nullopt when absent. Throws IntegrityViolation.
  std::optional<std::string> cached_object(const cid::Cid& cid) const;
  void accept_new_object(const cid::Cid& cid, std::shared_ptr<const std::string> bytes);
  Response object_response(const cid::Cid& cid, std::string bytes, bool head) const;
};

// Plain-text error response with the given status
Response make_error(unsigned status, const std::string& message);

} // namespace file_server
} // namespace magenc

#endif // MAGENC_FILE_SERVER_HPP
