#include "magnet/rasl_link.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <boost/log/trivial.hpp>
#include "network/url.hpp"

namespace magenc {
namespace magnet {

namespace {

bool has_prefix_nocase(const std::string& text, const std::string& prefix) {
  if (text.size() < prefix.size()) {
    return false;
  }
  return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
  });
}

// host[:port] of a seed, or nullopt when it is not one
std::optional<std::string> normalize_seed(const std::string& seed) {
  if (seed.find("://") != std::string::npos) {
    const auto url = network::Url::parse(seed);
    if (!url) {
      return std::nullopt;
    }
    return url->authority();
  }
  const auto url = network::Url::parse(std::string("https://") + seed);
  if (!url || url->target != "/") {
    return std::nullopt;
  }
  return url->authority();
}

// Some writers escape the separator inside the authority
std::string unescape_separator(std::string authority) {
  std::size_t pos = 0;
  while ((pos = authority.find('%', pos)) != std::string::npos) {
    if (pos + 2 < authority.size() && authority[pos + 1] == '3' &&
        (authority[pos + 2] == 'B' || authority[pos + 2] == 'b')) {
      authority.replace(pos, 3, ";");
    }
    ++pos;
  }
  return authority;
}

} // namespace

//===========================================
// PARSING AND SERIALIZATION
//===========================================

RaslLink RaslLink::parse(const std::string& link) {
  if (!has_prefix_nocase(link, SCHEME_PREFIX)) {
    throw InvalidParameter("rasl", "link does not start with web+rasl://");
  }

  const std::string rest = link.substr(std::string(SCHEME_PREFIX).size());
  const std::string authority = unescape_separator(rest.substr(0, rest.find_first_of("/?#")));
  const auto separator = authority.find(';');
  if (separator == std::string::npos) {
    throw InvalidParameter("rasl", "no seed list in " + link);
  }

  std::optional<cid::Cid> cid;
  try {
    cid = cid::Cid::decode(authority.substr(0, separator));
  } catch (const cid::CidError& e) {
    throw InvalidParameter("rasl", e.what());
  }

  RaslLink rasl(*cid);
  std::size_t start = separator + 1;
  while (start <= authority.size()) {
    std::size_t end = authority.find(',', start);
    if (end == std::string::npos) {
      end = authority.size();
    }
    const std::string seed = authority.substr(start, end - start);
    if (const auto normalized = normalize_seed(seed)) {
      if (std::find(rasl.seeds_.begin(), rasl.seeds_.end(), *normalized) == rasl.seeds_.end()) {
        rasl.seeds_.push_back(*normalized);
      }
    } else if (!seed.empty()) {
      BOOST_LOG_TRIVIAL(debug) << "Rasl: Skipping invalid seed '" << seed << "'";
    }
    start = end + 1;
  }
  return rasl;
}

std::string RaslLink::serialize() const {
  std::string out = SCHEME_PREFIX + cid_.encode() + ";";
  for (std::size_t i = 0; i < seeds_.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += seeds_[i];
  }
  return out + "/";
}


//===========================================
// SEEDS
//===========================================

bool RaslLink::add_seed(const std::string& seed) {
  const auto normalized = normalize_seed(seed);
  if (!normalized) {
    throw InvalidParameter("rasl", "not a host or http(s) URL: " + seed);
  }
  if (std::find(seeds_.begin(), seeds_.end(), *normalized) != seeds_.end()) {
    return false;
  }
  seeds_.push_back(*normalized);
  return true;
}

MagnetLink RaslLink::to_magnet() const {
  MagnetLink link(cid_);
  for (const auto& seed : seeds_) {
    link.add_source(CdnBase{"https://" + seed + WELL_KNOWN_PATH});
  }
  return link;
}

MagnetLink parse_retrieval_link(const std::string& text) {
  if (has_prefix_nocase(text, RaslLink::SCHEME_PREFIX)) {
    return RaslLink::parse(text).to_magnet();
  }
  return MagnetLink::parse(text);
}

} // namespace magnet
} // namespace magenc
