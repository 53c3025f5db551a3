#ifndef MAGENC_CID_CID_HPP
#define MAGENC_CID_CID_HPP

#include <array>
#include <cstdint>
#include <functional>
#include <istream>
#include <ostream>
#include <string>
#include <vector>
#include "cid/cid_error.hpp"

namespace magenc {
namespace cid {

// CIDv1, raw codec, sha2-256 multihash. Binary layout:
//   version(1) | codec(1) | hash function(1) | digest length(1) | digest(32)
// Text layout is the multibase 'b' flag followed by lowercase base32.
class Cid {
public:
  static constexpr uint8_t VERSION = 0x01;
  static constexpr uint8_t CODEC_RAW = 0x55;
  static constexpr uint8_t HASH_SHA256 = 0x12;
  static constexpr std::size_t DIGEST_SIZE = 32;
  static constexpr std::size_t BINARY_SIZE = 4 + DIGEST_SIZE;
  static constexpr char MULTIBASE_BASE32 = 'b';

  using Digest = std::array<uint8_t, DIGEST_SIZE>;

  // ---- CONSTRUCTOR ----
  explicit Cid(const Digest& digest) : digest_(digest) {}


  // ---- CODEC OPERATIONS ----
  // SHA-256 over the exact byte sequence
  static Cid compute(const std::string& bytes);
  static Cid compute(const uint8_t* data, std::size_t size);
  // Streams the input through the hash in chunks
  static Cid compute(std::istream& input);

  // Parses the canonical text form, throws MalformedCID
  static Cid decode(const std::string& text);
  // Parses the 36 byte binary form, throws MalformedCID
  static Cid from_bytes(const std::vector<uint8_t>& bytes);

  std::string encode() const;
  std::vector<uint8_t> to_bytes() const;


  // ---- GETTERS ----
  const Digest& digest() const { return digest_; }
  std::string digest_hex() const;


  // ---- COMPARISON ----
  bool operator==(const Cid& other) const { return digest_ == other.digest_; }
  bool operator!=(const Cid& other) const { return digest_ != other.digest_; }
  bool operator<(const Cid& other) const { return digest_ < other.digest_; }

private:
  Digest digest_;
};

std::ostream& operator<<(std::ostream& os, const Cid& cid);

} // namespace cid
} // namespace magenc

namespace std {

template <>
struct hash<magenc::cid::Cid> {
  std::size_t operator()(const magenc::cid::Cid& cid) const noexcept {
    // The digest is already uniformly distributed
    std::size_t value = 0;
    for (std::size_t i = 0; i < sizeof(value); ++i) {
      value = (value << 8) | cid.digest()[i];
    }
    return value;
  }
};

} // namespace std

#endif // MAGENC_CID_CID_HPP
