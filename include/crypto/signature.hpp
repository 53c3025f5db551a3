#ifndef MAGENC_CRYPTO_SIGNATURE_HPP
#define MAGENC_CRYPTO_SIGNATURE_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "crypto/crypto_error.hpp"

namespace magenc::crypto {

using PublicKey = std::array<uint8_t, 32>;

enum class SignatureSuite {
  Ed25519
};

std::optional<SignatureSuite> suite_from_string(const std::string& name);
const char* suite_to_string(SignatureSuite suite);

// Suite tag plus raw signature bytes, written as "<suite>:<base64url>"
struct Signature {
  SignatureSuite suite{SignatureSuite::Ed25519};
  std::vector<uint8_t> bytes;

  // Throws SignatureError on unknown suite, bad base64url or wrong length
  static Signature parse(const std::string& text);
  std::string to_string() const;

  bool operator==(const Signature& other) const {
    return suite == other.suite && bytes == other.bytes;
  }
};

// did:key identifier for an Ed25519 public key:
//   "did:key:z" + base58btc(0xed 0x01 || public key)
class DidKey {
public:
  static constexpr const char* PREFIX = "did:key:z";

  // Throws DidResolutionError when the identifier is not an Ed25519 did:key
  static DidKey resolve(const std::string& did);
  static DidKey from_public_key(const PublicKey& key);

  const std::string& did() const { return did_; }
  const PublicKey& public_key() const { return public_key_; }

private:
  DidKey(std::string did, const PublicKey& key) : did_(std::move(did)), public_key_(key) {}

  std::string did_;
  PublicKey public_key_;
};

// Verifies an Ed25519 signature over message. Never throws for a bad
// signature, only for OpenSSL failures.
bool verify(const Signature& signature, const PublicKey& key, const std::string& message);

class Ed25519Signer {
public:
  static constexpr std::size_t SEED_SIZE = 32;

  // ---- CONSTRUCTION ----
  static Ed25519Signer generate();
  // Throws CryptoError if seed is not 32 bytes
  static Ed25519Signer from_seed(const std::vector<uint8_t>& seed);


  // ---- OPERATIONS ----
  Signature sign(const std::string& message) const;
  DidKey did_key() const { return DidKey::from_public_key(public_key_); }
  const PublicKey& public_key() const { return public_key_; }

private:
  Ed25519Signer(const std::vector<uint8_t>& seed, const PublicKey& key)
    : seed_(seed), public_key_(key) {}

  std::vector<uint8_t> seed_;
  PublicKey public_key_;
};

} // namespace magenc::crypto

#endif // MAGENC_CRYPTO_SIGNATURE_HPP
