#ifndef MAGENC_FETCH_FETCHER_HPP
#define MAGENC_FETCH_FETCHER_HPP

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include "cid/cid.hpp"
#include "fetch/fetch_error.hpp"
#include "magnet/magnet_link.hpp"
#include "network/http_client.hpp"

namespace magenc {
namespace fetch {

// Shared flag; copies observe the same cancellation
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() { flag_->store(true); }
  bool is_cancelled() const { return flag_->load(); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

// Tries the candidates of a magnet link in order until one returns bytes
// that hash to the link's CID and, for signed links, carry a valid
// signature.
class Fetcher {
public:
  // ---- CONSTRUCTOR ----
  explicit Fetcher(network::HttpClient& client) : client_(client) {}


  // ---- FETCH OPERATIONS ----
  // Throws AllSourcesExhausted or FetchCancelled
  std::string fetch(const magnet::MagnetLink& link,
                    const CancellationToken& cancel = CancellationToken()) const;
  // GET base + "/" + cid with the same integrity check. Throws
  // AllSourcesExhausted carrying the single failure.
  std::string fetch_from(const std::string& base_url, const cid::Cid& cid) const;
  // HEAD base + "/" + cid. True on a 2xx answer; the body is not checked.
  bool has_object(const std::string& base_url, const cid::Cid& cid) const;

private:
  // Returns the failure, or nullopt with body filled in
  std::optional<SourceFailure> try_source(const std::string& url, const cid::Cid& expected,
                                          const magnet::MagnetLink* link,
                                          std::string& body) const;

  network::HttpClient& client_;
};

} // namespace fetch
} // namespace magenc

#endif // MAGENC_FETCH_FETCHER_HPP
