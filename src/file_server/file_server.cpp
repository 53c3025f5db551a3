#include "file_server/file_server.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "crypto/crypto_error.hpp"
#include "federation/federation_error.hpp"
#include "magnet/magnet_link.hpp"
#include "magnet/rasl_link.hpp"
#include "network/url.hpp"

namespace magenc {
namespace file_server {

namespace {

const char* USAGE =
  "magenc content-addressed HTTP node\n"
  "\n"
  "GET  /{CID}              raw bytes of a stored object\n"
  "HEAD /{CID}              headers only\n"
  "GET  /?magnet={link}     fetch a magnet or web+rasl link through its sources\n"
  "POST /                   store the request body, answers with its CID\n"
  "POST /notify             announce a CID held by the X-Magenc-Peer node\n";

std::string trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

// Value of key in an application/x-www-form-urlencoded query, still escaped
std::optional<std::string> query_value(const std::string& query, const std::string& key) {
  std::size_t start = 0;
  while (start <= query.size()) {
    std::size_t end = query.find('&', start);
    if (end == std::string::npos) {
      end = query.size();
    }
    const std::string pair = query.substr(start, end - start);
    const std::size_t eq = pair.find('=');
    if (pair.substr(0, eq) == key) {
      return eq == std::string::npos ? std::string() : pair.substr(eq + 1);
    }
    start = end + 1;
  }
  return std::nullopt;
}

} // namespace

std::optional<std::string> Request::header(const std::string& name) const {
  auto it = headers.find(lowercase(name));
  if (it == headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

Response make_error(unsigned status, const std::string& message) {
  Response response;
  response.status = status;
  response.body = message + "\n";
  response.headers["Content-Type"] = "text/plain; charset=utf-8";
  return response;
}


//==============================================
// CONSTRUCTOR
//==============================================

FileServer::FileServer(store::Store& store, federation::PeerManager& peers,
                       federation::FederationEngine& federation, fetch::Fetcher& fetcher,
                       FileServerOptions options)
  : store_(store)
  , peers_(peers)
  , federation_(federation)
  , fetcher_(fetcher)
  , options_(options) {
  BOOST_LOG_TRIVIAL(info) << "File server: Initialized, POST "
                          << (options_.allow_post ? "enabled" : "disabled");
}


//==============================================
// PROCESSING OF HTTP REQUESTS
//==============================================

Response FileServer::handle(const Request& request) {
  BOOST_LOG_TRIVIAL(debug) << "File server: " << request.method << " " << request.target
                           << " from " << request.remote_host;

  const auto query_start = request.target.find('?');
  const std::string path = request.target.substr(0, query_start);
  const bool is_get = request.method == "GET";
  const bool is_head = request.method == "HEAD";

  try {
    if (path == "/") {
      if (is_get || is_head) {
        return handle_index(request, is_head);
      }
      if (request.method == "POST") {
        return handle_post(request);
      }
      return make_error(405, "Method not allowed");
    }

    if (path == "/notify") {
      if (request.method == "POST") {
        return handle_notify(request);
      }
      return make_error(405, "Method not allowed");
    }

    if (path.size() > 1 && path.find('/', 1) == std::string::npos) {
      if (is_get || is_head) {
        return handle_get(path.substr(1), is_head);
      }
      return make_error(405, "Method not allowed");
    }

    return make_error(404, "Not found");
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "File server: Failed to handle " << request.method << " "
                             << request.target << ": " << e.what();
    return make_error(500, "Internal server error");
  }
}

Response FileServer::handle_index(const Request& request, bool head) {
  const auto query_start = request.target.find('?');
  if (query_start != std::string::npos) {
    const auto link = query_value(request.target.substr(query_start + 1), "magnet");
    if (link) {
      const auto decoded = network::unescape_component(*link);
      if (!decoded) {
        return make_error(400, "Malformed magnet parameter");
      }
      return handle_gateway(*decoded, head);
    }
  }

  Response response;
  response.headers["Content-Type"] = "text/plain; charset=utf-8";
  if (head) {
    response.content_length = std::string(USAGE).size();
  } else {
    response.body = USAGE;
  }
  return response;
}

Response FileServer::handle_get(const std::string& cid_text, bool head) {
  std::optional<cid::Cid> cid;
  try {
    cid = cid::Cid::decode(cid_text);
  } catch (const cid::CidError& e) {
    return make_error(400, e.what());
  }

  try {
    return object_response(*cid, store_.get_verified(*cid), head);
  } catch (const store::NotFound&) {
    return make_error(404, "Not found: " + cid->encode());
  } catch (const store::IntegrityViolation& e) {
    BOOST_LOG_TRIVIAL(error) << "File server: " << e.what();
    return make_error(500, "Stored object is corrupt");
  }
}

Response FileServer::handle_gateway(const std::string& link_text, bool head) {
  std::optional<magnet::MagnetLink> link;
  try {
    link = magnet::parse_retrieval_link(link_text);
  } catch (const magnet::MagnetError& e) {
    return make_error(400, e.what());
  }

  try {
    // A cached copy is held to the same signature check as a fetched one
    if (auto cached = cached_object(link->cid())) {
      std::string reason;
      try {
        if (!link->verify_signature(*cached)) {
          reason = "signature does not verify for the stored object";
        }
      } catch (const crypto::CryptoError& e) {
        reason = e.what();
      }
      if (!reason.empty()) {
        BOOST_LOG_TRIVIAL(warning) << "File server: Gateway link for " << link->cid() << " rejected: " << reason;
        throw fetch::AllSourcesExhausted({fetch::SourceFailure{
            "/" + link->cid().encode(), reason, fetch::FailureKind::SIGNATURE_INVALID}});
      }
      return object_response(link->cid(), std::move(*cached), head);
    }

    std::string bytes = fetcher_.fetch(*link);
    store_.put(bytes);
    return object_response(link->cid(), std::move(bytes), head);
  } catch (const fetch::AllSourcesExhausted& e) {
    std::stringstream message;
    message << e.what();
    for (const auto& failure : e.failures()) {
      message << "\n" << failure.url << ": " << failure.reason;
    }
    return make_error(e.all_timeouts() ? 504 : 502, message.str());
  } catch (const store::IntegrityViolation& e) {
    BOOST_LOG_TRIVIAL(error) << "File server: " << e.what();
    return make_error(500, "Stored object is corrupt");
  }
}

Response FileServer::handle_post(const Request& request) {
  if (!options_.allow_post) {
    return make_error(403, "POST is disabled on this node");
  }

  std::optional<federation::Peer> declared;
  try {
    declared = declared_peer(request);
    peers_.admit_caller(declared, request.remote_host, declared.has_value());
  } catch (const std::invalid_argument& e) {
    return make_error(400, e.what());
  } catch (const federation::PeerRejected& e) {
    return make_error(403, e.what());
  }

  const cid::Cid actual = cid::Cid::compute(request.body);
  if (const auto asserted = request.header(federation::FederationEngine::CID_HEADER)) {
    std::optional<cid::Cid> expected;
    try {
      expected = cid::Cid::decode(trim(*asserted));
    } catch (const cid::CidError& e) {
      return make_error(400, e.what());
    }
    if (*expected != actual) {
      const store::IntegrityViolation violation(*expected, actual);
      BOOST_LOG_TRIVIAL(warning) << "File server: Rejecting push: " << violation.what();
      return make_error(400, violation.what());
    }
  }

  auto bytes = std::make_shared<const std::string>(request.body);
  bool created = false;
  const cid::Cid cid = store_.put(*bytes, &created);
  if (created) {
    accept_new_object(cid, bytes);
  }

  Response response;
  response.status = 201;
  response.body = cid.encode();
  response.headers["Location"] = "/" + cid.encode();
  response.headers[federation::FederationEngine::CID_HEADER] = cid.encode();
  response.headers["Content-Type"] = "text/plain; charset=utf-8";
  return response;
}

Response FileServer::handle_notify(const Request& request) {
  if (!options_.allow_post) {
    return make_error(403, "POST is disabled on this node");
  }

  std::optional<federation::Peer> declared;
  try {
    declared = declared_peer(request);
    if (!declared) {
      return make_error(400, std::string("Missing ") + federation::FederationEngine::PEER_HEADER + " header");
    }
    peers_.admit_caller(declared, request.remote_host, true);
  } catch (const std::invalid_argument& e) {
    return make_error(400, e.what());
  } catch (const federation::PeerRejected& e) {
    return make_error(403, e.what());
  }

  std::optional<cid::Cid> cid;
  try {
    cid = cid::Cid::decode(trim(request.body));
  } catch (const cid::CidError& e) {
    return make_error(400, e.what());
  }

  if (store_.has(*cid)) {
    BOOST_LOG_TRIVIAL(debug) << "File server: Announcement of known object " << *cid;
  } else {
    const federation::Peer announcer = *declared;
    const cid::Cid announced = *cid;
    federation_.run_in_background([this, announcer, announced]() {
      pull_announced(announcer, announced);
    });
  }

  Response response;
  response.status = 202;
  response.body = cid->encode();
  response.headers["Content-Type"] = "text/plain; charset=utf-8";
  return response;
}


//==============================================
// PROCESSING OF LOCAL REQUESTS
//==============================================

cid::Cid FileServer::store_file(std::istream& input) {
  bool created = false;
  const cid::Cid cid = store_.put(input, &created);
  if (created) {
    accept_new_object(cid, std::make_shared<const std::string>(store_.get(cid)));
  }
  return cid;
}

std::string FileServer::get_file(const cid::Cid& cid) const {
  return store_.get_verified(cid);
}


//==============================================
// SUPPORT
//==============================================

std::optional<federation::Peer> FileServer::declared_peer(const Request& request) const {
  const auto header = request.header(federation::FederationEngine::PEER_HEADER);
  if (!header) {
    return std::nullopt;
  }
  auto peer = federation::Peer::parse(trim(*header));
  if (!peer) {
    throw std::invalid_argument(std::string("Malformed ") + federation::FederationEngine::PEER_HEADER
                                + " header: " + *header);
  }
  return peer;
}

void FileServer::pull_announced(const federation::Peer& announcer, const cid::Cid& cid) {
  BOOST_LOG_TRIVIAL(info) << "File server: Pulling announced " << cid << " from " << announcer;
  try {
    auto bytes = std::make_shared<const std::string>(fetcher_.fetch_from(announcer.base(), cid));
    bool created = false;
    store_.put(*bytes, &created);
    if (created) {
      accept_new_object(cid, bytes);
    }
  } catch (const fetch::FetchError& e) {
    BOOST_LOG_TRIVIAL(warning) << "File server: Could not pull " << cid << " from " << announcer
                               << ": " << e.what();
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "File server: Could not store announced " << cid << ": " << e.what();
  }
}

std::optional<std::string> FileServer::cached_object(const cid::Cid& cid) const {
  try {
    return store_.get_verified(cid);
  } catch (const store::NotFound&) {
    return std::nullopt;
  }
}

void FileServer::accept_new_object(const cid::Cid& cid, std::shared_ptr<const std::string> bytes) {
  BOOST_LOG_TRIVIAL(info) << "File server: New object " << cid << " (" << bytes->size() << " bytes)";
  federation_.federate(cid, std::move(bytes));
}

Response FileServer::object_response(const cid::Cid& cid, std::string bytes, bool head) const {
  Response response;
  response.headers["Content-Type"] = "application/octet-stream";
  response.headers[federation::FederationEngine::CID_HEADER] = cid.encode();
  response.headers["ETag"] = "\"" + cid.encode() + "\"";
  if (head) {
    response.content_length = bytes.size();
  } else {
    response.body = std::move(bytes);
  }
  return response;
}

} // namespace file_server
} // namespace magenc
