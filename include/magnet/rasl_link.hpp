#ifndef MAGENC_MAGNET_RASL_LINK_HPP
#define MAGENC_MAGNET_RASL_LINK_HPP

#include <string>
#include <vector>
#include "cid/cid.hpp"
#include "magnet/magnet_link.hpp"

namespace magenc {
namespace magnet {

// web+rasl://<cid>;<seed>,<seed>/ where each seed is a host[:port] that
// serves the object at https://<seed>/.well-known/rasl/<cid>
class RaslLink {
public:
  static constexpr const char* SCHEME_PREFIX = "web+rasl://";
  static constexpr const char* WELL_KNOWN_PATH = "/.well-known/rasl";

  // ---- CONSTRUCTOR ----
  explicit RaslLink(const cid::Cid& cid) : cid_(cid) {}


  // ---- PARSING AND SERIALIZATION ----
  // Throws InvalidParameter. Seeds that are not a valid host[:port] are skipped.
  static RaslLink parse(const std::string& link);
  std::string serialize() const;


  // ---- SEEDS ----
  // Accepts a bare host[:port] or an http(s) URL, of which only the
  // authority is kept. Returns false for a duplicate, throws InvalidParameter.
  bool add_seed(const std::string& seed);

  // Magnet link with one CDN base per seed
  MagnetLink to_magnet() const;


  // ---- GETTERS ----
  const cid::Cid& cid() const { return cid_; }
  const std::vector<std::string>& seeds() const { return seeds_; }

private:
  cid::Cid cid_;
  std::vector<std::string> seeds_;
};

// Parses either link form into a magnet link. Throws MagnetError.
MagnetLink parse_retrieval_link(const std::string& text);

} // namespace magnet
} // namespace magenc

#endif // MAGENC_MAGNET_RASL_LINK_HPP
