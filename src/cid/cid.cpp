#include "cid/cid.hpp"
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>
#include "cid/base32.hpp"

namespace magenc {
namespace cid {

//==============================================
// RAII WRAPPER FOR THE DIGEST CONTEXT
//==============================================

namespace {

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw CidError("CID: Failed to create hash context");
    }
    if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr)) {
      EVP_MD_CTX_free(ctx);
      throw CidError("CID: Failed to initialize hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  void update(const void* data, std::size_t size) {
    if (!EVP_DigestUpdate(ctx, data, size)) {
      throw CidError("CID: Failed to update hash");
    }
  }

  Cid::Digest finish() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (!EVP_DigestFinal_ex(ctx, hash, &hash_len) || hash_len != Cid::DIGEST_SIZE) {
      throw CidError("CID: Failed to finalize hash");
    }
    Cid::Digest digest;
    std::copy(hash, hash + Cid::DIGEST_SIZE, digest.begin());
    return digest;
  }
};

} // namespace


//==============================================
// CODEC OPERATIONS
//==============================================

Cid Cid::compute(const std::string& bytes) {
  return compute(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
}

Cid Cid::compute(const uint8_t* data, std::size_t size) {
  DigestContext context;
  context.update(data, size);
  return Cid(context.finish());
}

Cid Cid::compute(std::istream& input) {
  DigestContext context;
  char buffer[8192];
  std::size_t total_bytes = 0;

  while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
    context.update(buffer, static_cast<std::size_t>(input.gcount()));
    total_bytes += static_cast<std::size_t>(input.gcount());
  }

  if (input.bad()) {
    throw CidError("CID: Failed to read input stream");
  }

  BOOST_LOG_TRIVIAL(trace) << "CID: Hashed " << total_bytes << " bytes from stream";
  return Cid(context.finish());
}

Cid Cid::decode(const std::string& text) {
  if (text.empty() || text[0] != MULTIBASE_BASE32) {
    throw MalformedCID("expected multibase prefix '" + std::string(1, MULTIBASE_BASE32) + "'");
  }

  auto bytes = decode_base32(text.substr(1));
  if (!bytes) {
    throw MalformedCID("invalid base32 body");
  }

  return from_bytes(*bytes);
}

Cid Cid::from_bytes(const std::vector<uint8_t>& bytes) {
  if (bytes.size() != BINARY_SIZE) {
    throw MalformedCID("expected " + std::to_string(BINARY_SIZE) + " bytes, got " +
                       std::to_string(bytes.size()));
  }
  if (bytes[0] != VERSION) {
    throw MalformedCID("unsupported version " + std::to_string(bytes[0]));
  }
  if (bytes[1] != CODEC_RAW) {
    throw MalformedCID("unsupported codec " + std::to_string(bytes[1]));
  }
  if (bytes[2] != HASH_SHA256) {
    throw MalformedCID("unsupported hash function " + std::to_string(bytes[2]));
  }
  if (bytes[3] != DIGEST_SIZE) {
    throw MalformedCID("unsupported digest length " + std::to_string(bytes[3]));
  }

  Digest digest;
  std::copy(bytes.begin() + 4, bytes.end(), digest.begin());
  return Cid(digest);
}

std::string Cid::encode() const {
  return std::string(1, MULTIBASE_BASE32) + encode_base32(to_bytes());
}

std::vector<uint8_t> Cid::to_bytes() const {
  std::vector<uint8_t> bytes;
  bytes.reserve(BINARY_SIZE);
  bytes.push_back(VERSION);
  bytes.push_back(CODEC_RAW);
  bytes.push_back(HASH_SHA256);
  bytes.push_back(static_cast<uint8_t>(DIGEST_SIZE));
  bytes.insert(bytes.end(), digest_.begin(), digest_.end());
  return bytes;
}

std::string Cid::digest_hex() const {
  std::stringstream ss;
  for (uint8_t byte : digest_) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Cid& cid) {
  return os << cid.encode();
}

} // namespace cid
} // namespace magenc
