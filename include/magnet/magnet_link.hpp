#ifndef MAGENC_MAGNET_MAGNET_LINK_HPP
#define MAGENC_MAGNET_MAGNET_LINK_HPP

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "cid/cid.hpp"
#include "crypto/signature.hpp"
#include "magnet/key_rules.hpp"
#include "magnet/magnet_error.hpp"

namespace magenc {
namespace magnet {

// Base URL of a CDN; the object lives at base + "/" + cid
struct CdnBase {
  std::string base;
  bool operator==(const CdnBase& other) const { return base == other.base; }
};

// URL that serves the object verbatim
struct ExactSource {
  std::string url;
  bool operator==(const ExactSource& other) const { return url == other.url; }
};

using CandidateSource = std::variant<CdnBase, ExactSource>;

// Fetch URL for a candidate
std::string resolve(const CandidateSource& source, const cid::Cid& cid);

// Parameter this system does not interpret, kept exactly as written
struct OpaqueParameter {
  std::string key;
  std::string text;   // whole "key=value" segment, still escaped
  bool operator==(const OpaqueParameter& other) const { return text == other.text; }
};

class MagnetLink {
public:
  static constexpr const char* SCHEME_PREFIX = "magnet:?";
  static constexpr const char* CID_URN_PREFIX = "urn:cid:";

  // ---- CONSTRUCTOR ----
  explicit MagnetLink(const cid::Cid& cid) : cid_(cid) {}


  // ---- PARSING AND SERIALIZATION ----
  // Throws MissingIdentifier or InvalidParameter
  static MagnetLink parse(const std::string& link, const KeyRules& rules = KeyRules::standard());
  std::string serialize(const KeyRules& rules = KeyRules::standard()) const;


  // ---- LINK CREATION ----
  // Computes the CID of bytes and bundles the given candidates
  static MagnetLink create(const std::string& bytes,
                           const std::vector<std::string>& cdn_bases,
                           const std::vector<std::string>& exact_sources,
                           const std::optional<std::string>& display_name = std::nullopt);
  // Signs bytes, which must hash to the identifier
  void sign(const crypto::Ed25519Signer& signer, const std::string& bytes);


  // ---- CANDIDATE SOURCES ----
  // Returns false for a duplicate, throws InvalidParameter for a bad URL
  bool add_source(const CandidateSource& source);
  // Resolved fetch URLs in candidate order
  std::vector<std::string> candidate_urls() const;


  // ---- SIGNATURE ----
  bool is_signed() const { return signature_.has_value(); }
  // True for unsigned links, otherwise the Ed25519 check against the signer
  bool verify_signature(const std::string& bytes) const;
  void set_signature(const crypto::Signature& signature, const crypto::DidKey& signer);


  // ---- GETTERS AND SETTERS ----
  const cid::Cid& cid() const { return cid_; }
  const std::vector<CandidateSource>& sources() const { return sources_; }
  const std::vector<std::string>& topics() const { return topics_; }
  const std::optional<std::string>& display_name() const { return display_name_; }
  const std::optional<crypto::Signature>& signature() const { return signature_; }
  const std::optional<crypto::DidKey>& signer() const { return signer_; }
  const std::vector<OpaqueParameter>& opaque_parameters() const { return opaque_; }

  void set_display_name(const std::string& name) { display_name_ = name; }
  void add_topic(const std::string& topic) { topics_.push_back(topic); }

private:
  // ---- PARAMETERS ----
  cid::Cid cid_;
  std::vector<CandidateSource> sources_;
  // Non-CID xt values such as urn:btih, kept for BitTorrent hybrids
  std::vector<std::string> topics_;
  std::optional<std::string> display_name_;
  std::optional<crypto::Signature> signature_;
  std::optional<crypto::DidKey> signer_;
  std::vector<OpaqueParameter> opaque_;
};

} // namespace magnet
} // namespace magenc

#endif // MAGENC_MAGNET_MAGNET_LINK_HPP
