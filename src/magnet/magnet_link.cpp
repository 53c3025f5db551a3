#include "magnet/magnet_link.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include "network/url.hpp"

namespace magenc {
namespace magnet {

namespace {

// Characters left readable in values: URL and URN punctuation that has no
// meaning inside a magnet query
const std::string VALUE_SAFE = ":/@!$'()*,;";

std::string escape_value(const std::string& value) {
  return network::escape_component(value, VALUE_SAFE);
}

void require_url(const std::string& key, const std::string& value) {
  if (!network::Url::parse(value)) {
    throw InvalidParameter(key, "not an absolute http(s) URL: " + value);
  }
}

bool starts_with(const std::string& text, const std::string& prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

//===========================================
// CANDIDATE RESOLUTION
//===========================================

std::string resolve(const CandidateSource& source, const cid::Cid& cid) {
  if (const auto* cdn = std::get_if<CdnBase>(&source)) {
    std::string base = cdn->base;
    while (!base.empty() && base.back() == '/') {
      base.pop_back();
    }
    return base + "/" + cid.encode();
  }
  return std::get<ExactSource>(source).url;
}


//===========================================
// PARSING
//===========================================

MagnetLink MagnetLink::parse(const std::string& link, const KeyRules& rules) {
  if (!starts_with(link, SCHEME_PREFIX)) {
    throw InvalidParameter("magnet", "link does not start with magnet:?");
  }

  std::optional<cid::Cid> identifier;
  std::vector<CandidateSource> sources;
  std::vector<std::string> topics;
  std::optional<std::string> display_name;
  std::optional<crypto::Signature> signature;
  std::optional<crypto::DidKey> signer;
  std::vector<OpaqueParameter> opaque;

  auto set_identifier = [&identifier](const std::string& key, const std::string& text) {
    std::optional<cid::Cid> parsed;
    try {
      parsed = cid::Cid::decode(text);
    } catch (const cid::CidError& e) {
      throw InvalidParameter(key, e.what());
    }
    if (identifier && *identifier != *parsed) {
      throw InvalidParameter(key, "conflicting CID " + text + " (already " + identifier->encode() + ")");
    }
    identifier = parsed;
  };

  const std::string query = link.substr(std::string(SCHEME_PREFIX).size());
  std::size_t start = 0;
  while (start <= query.size()) {
    std::size_t end = query.find('&', start);
    if (end == std::string::npos) {
      end = query.size();
    }
    const std::string segment = query.substr(start, end - start);
    start = end + 1;
    if (segment.empty()) {
      continue;
    }

    const std::size_t eq = segment.find('=');
    const std::string key = segment.substr(0, eq);
    const std::string raw = eq == std::string::npos ? std::string() : segment.substr(eq + 1);

    const auto role = rules.role_of(key);
    if (!role) {
      opaque.push_back({key, segment});
      continue;
    }

    const auto value = network::unescape_component(raw);
    if (!value) {
      throw InvalidParameter(key, "bad percent-encoding");
    }

    switch (*role) {
      case FieldRole::Topic:
        if (starts_with(*value, CID_URN_PREFIX)) {
          set_identifier(key, value->substr(std::string(CID_URN_PREFIX).size()));
        } else {
          topics.push_back(*value);
        }
        break;
      case FieldRole::Identifier:
        set_identifier(key, *value);
        break;
      case FieldRole::CdnBase:
        require_url(key, *value);
        sources.emplace_back(CdnBase{*value});
        break;
      case FieldRole::ExactSource:
        require_url(key, *value);
        sources.emplace_back(ExactSource{*value});
        break;
      case FieldRole::DisplayName:
        if (display_name) {
          throw InvalidParameter(key, "repeated");
        }
        display_name = *value;
        break;
      case FieldRole::Signature:
        if (signature) {
          throw InvalidParameter(key, "repeated");
        }
        try {
          signature = crypto::Signature::parse(*value);
        } catch (const crypto::CryptoError& e) {
          throw InvalidParameter(key, e.what());
        }
        break;
      case FieldRole::Signer:
        if (signer) {
          throw InvalidParameter(key, "repeated");
        }
        try {
          signer = crypto::DidKey::resolve(*value);
        } catch (const crypto::CryptoError& e) {
          throw InvalidParameter(key, e.what());
        }
        break;
    }
  }

  if (!identifier) {
    throw MissingIdentifier();
  }
  if (signature && !signer) {
    throw InvalidParameter(rules.canonical_key(FieldRole::Signature), "signature without signer");
  }

  MagnetLink result(*identifier);
  for (const auto& source : sources) {
    result.add_source(source);
  }
  result.topics_ = std::move(topics);
  result.display_name_ = std::move(display_name);
  result.signature_ = std::move(signature);
  result.signer_ = std::move(signer);
  result.opaque_ = std::move(opaque);

  BOOST_LOG_TRIVIAL(debug) << "Magnet: Parsed link for " << result.cid_
                           << " with " << result.sources_.size() << " candidate(s)";
  return result;
}


//===========================================
// SERIALIZATION
//===========================================

std::string MagnetLink::serialize(const KeyRules& rules) const {
  const std::string& topic_key = rules.canonical_key(FieldRole::Topic);

  std::string out = SCHEME_PREFIX;
  out += topic_key + "=" + CID_URN_PREFIX + cid_.encode();

  for (const auto& topic : topics_) {
    out += "&" + topic_key + "=" + escape_value(topic);
  }
  if (display_name_) {
    out += "&" + rules.canonical_key(FieldRole::DisplayName) + "=" + escape_value(*display_name_);
  }
  for (const auto& source : sources_) {
    if (const auto* cdn = std::get_if<CdnBase>(&source)) {
      out += "&" + rules.canonical_key(FieldRole::CdnBase) + "=" + escape_value(cdn->base);
    } else {
      out += "&" + rules.canonical_key(FieldRole::ExactSource) + "="
           + escape_value(std::get<ExactSource>(source).url);
    }
  }
  if (signature_ && signer_) {
    out += "&" + rules.canonical_key(FieldRole::Signature) + "=" + escape_value(signature_->to_string());
    out += "&" + rules.canonical_key(FieldRole::Signer) + "=" + escape_value(signer_->did());
  }
  for (const auto& param : opaque_) {
    out += "&" + param.text;
  }
  return out;
}


//===========================================
// CREATION AND SIGNING
//===========================================

MagnetLink MagnetLink::create(const std::string& bytes,
                              const std::vector<std::string>& cdn_bases,
                              const std::vector<std::string>& exact_sources,
                              const std::optional<std::string>& display_name) {
  MagnetLink link(cid::Cid::compute(bytes));
  for (const auto& base : cdn_bases) {
    link.add_source(CdnBase{base});
  }
  for (const auto& url : exact_sources) {
    link.add_source(ExactSource{url});
  }
  link.display_name_ = display_name;
  return link;
}

void MagnetLink::sign(const crypto::Ed25519Signer& signer, const std::string& bytes) {
  if (cid::Cid::compute(bytes) != cid_) {
    throw InvalidParameter("sig", "content does not hash to " + cid_.encode());
  }
  signature_ = signer.sign(bytes);
  signer_ = signer.did_key();
  BOOST_LOG_TRIVIAL(debug) << "Magnet: Signed " << cid_ << " as " << signer_->did();
}

void MagnetLink::set_signature(const crypto::Signature& signature, const crypto::DidKey& signer) {
  signature_ = signature;
  signer_ = signer;
}

bool MagnetLink::verify_signature(const std::string& bytes) const {
  if (!signature_) {
    return true;
  }
  if (!signer_) {
    return false;
  }
  return crypto::verify(*signature_, signer_->public_key(), bytes);
}


//===========================================
// CANDIDATE SOURCES
//===========================================

bool MagnetLink::add_source(const CandidateSource& source) {
  if (const auto* cdn = std::get_if<CdnBase>(&source)) {
    require_url("cdn", cdn->base);
  } else {
    require_url("xs", std::get<ExactSource>(source).url);
  }
  if (std::find(sources_.begin(), sources_.end(), source) != sources_.end()) {
    return false;
  }
  sources_.push_back(source);
  return true;
}

std::vector<std::string> MagnetLink::candidate_urls() const {
  std::vector<std::string> urls;
  urls.reserve(sources_.size());
  for (const auto& source : sources_) {
    urls.push_back(resolve(source, cid_));
  }
  return urls;
}

} // namespace magnet
} // namespace magenc
