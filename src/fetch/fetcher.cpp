#include "fetch/fetcher.hpp"
#include <vector>
#include <boost/log/trivial.hpp>

namespace magenc {
namespace fetch {

//==============================================
// FETCH OPERATIONS
//==============================================

std::string Fetcher::fetch(const magnet::MagnetLink& link, const CancellationToken& cancel) const {
  const auto urls = link.candidate_urls();
  BOOST_LOG_TRIVIAL(info) << "Fetcher: Fetching " << link.cid() << " from " << urls.size() << " candidate(s)";

  std::vector<SourceFailure> failures;
  for (const auto& url : urls) {
    if (cancel.is_cancelled()) {
      BOOST_LOG_TRIVIAL(info) << "Fetcher: Cancelled after " << failures.size() << " failed candidate(s)";
      throw FetchCancelled();
    }

    std::string body;
    auto failure = try_source(url, link.cid(), &link, body);
    if (!failure) {
      BOOST_LOG_TRIVIAL(info) << "Fetcher: Verified " << link.cid() << " from " << url;
      return body;
    }

    BOOST_LOG_TRIVIAL(warning) << "Fetcher: Source " << url << " rejected ("
                               << failure_kind_to_string(failure->kind) << "): " << failure->reason;
    failures.push_back(std::move(*failure));
  }

  BOOST_LOG_TRIVIAL(error) << "Fetcher: Every candidate for " << link.cid() << " failed";
  throw AllSourcesExhausted(std::move(failures));
}

std::string Fetcher::fetch_from(const std::string& base_url, const cid::Cid& cid) const {
  const std::string url = magnet::resolve(magnet::CdnBase{base_url}, cid);

  std::string body;
  auto failure = try_source(url, cid, nullptr, body);
  if (failure) {
    BOOST_LOG_TRIVIAL(warning) << "Fetcher: " << url << " rejected: " << failure->reason;
    throw AllSourcesExhausted({std::move(*failure)});
  }
  return body;
}

bool Fetcher::has_object(const std::string& base_url, const cid::Cid& cid) const {
  const std::string url = magnet::resolve(magnet::CdnBase{base_url}, cid);
  const auto result = client_.head(url);
  BOOST_LOG_TRIVIAL(debug) << "Fetcher: HEAD " << url << ": " << result.describe();
  return result.ok();
}


//==============================================
// SOURCE VERIFICATION
//==============================================

std::optional<SourceFailure> Fetcher::try_source(const std::string& url, const cid::Cid& expected,
                                                 const magnet::MagnetLink* link,
                                                 std::string& body) const {
  auto result = client_.get(url);

  if (result.error == network::NetworkError::TIMEOUT) {
    return SourceFailure{url, result.describe(), FailureKind::TIMEOUT};
  }
  if (result.error != network::NetworkError::SUCCESS) {
    return SourceFailure{url, result.describe(), FailureKind::TRANSPORT};
  }
  if (!result.ok()) {
    return SourceFailure{url, result.describe(), FailureKind::HTTP_STATUS};
  }

  const cid::Cid actual = cid::Cid::compute(result.body);
  if (actual != expected) {
    return SourceFailure{url, "content hashes to " + actual.encode(), FailureKind::INTEGRITY_MISMATCH};
  }

  if (link && link->is_signed()) {
    bool valid = false;
    try {
      valid = link->verify_signature(result.body);
    } catch (const crypto::CryptoError& e) {
      return SourceFailure{url, e.what(), FailureKind::SIGNATURE_INVALID};
    }
    if (!valid) {
      return SourceFailure{url, "signature does not verify for " + link->signer()->did(),
                           FailureKind::SIGNATURE_INVALID};
    }
  }

  body = std::move(result.body);
  return std::nullopt;
}

} // namespace fetch
} // namespace magenc
