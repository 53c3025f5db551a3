#include "crypto/signature.hpp"
#include <memory>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>
#include "crypto/encoding.hpp"

namespace magenc::crypto {

namespace {

constexpr std::size_t ED25519_SIGNATURE_SIZE = 64;
constexpr uint8_t MULTICODEC_ED25519_PUB[] = {0xed, 0x01};

//==============================================
// RAII WRAPPERS FOR OPENSSL HANDLES
//==============================================

struct KeyHandle {
  EVP_PKEY* key = nullptr;

  explicit KeyHandle(EVP_PKEY* k) : key(k) {
    if (!key) {
      throw CryptoError("Signature: Failed to create key");
    }
  }
  ~KeyHandle() { EVP_PKEY_free(key); }

  KeyHandle(const KeyHandle&) = delete;
  KeyHandle& operator=(const KeyHandle&) = delete;
};

struct SignContext {
  EVP_MD_CTX* ctx = nullptr;

  SignContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw CryptoError("Signature: Failed to create digest context");
    }
  }
  ~SignContext() { EVP_MD_CTX_free(ctx); }

  SignContext(const SignContext&) = delete;
  SignContext& operator=(const SignContext&) = delete;
};

} // namespace

//==============================================
// SIGNATURE SUITES
//==============================================

std::optional<SignatureSuite> suite_from_string(const std::string& name) {
  if (name == "ed25519") {
    return SignatureSuite::Ed25519;
  }
  return std::nullopt;
}

const char* suite_to_string(SignatureSuite suite) {
  switch (suite) {
    case SignatureSuite::Ed25519: return "ed25519";
    default:                      return "unknown";
  }
}

Signature Signature::parse(const std::string& text) {
  auto colon = text.find(':');
  if (colon == std::string::npos) {
    throw SignatureError("missing suite tag in '" + text + "'");
  }

  auto suite = suite_from_string(text.substr(0, colon));
  if (!suite) {
    throw SignatureError("unsupported suite '" + text.substr(0, colon) + "'");
  }

  auto bytes = decode_base64url(text.substr(colon + 1));
  if (!bytes) {
    throw SignatureError("signature is not valid base64url");
  }
  if (*suite == SignatureSuite::Ed25519 && bytes->size() != ED25519_SIGNATURE_SIZE) {
    throw SignatureError("ed25519 signature must be " + std::to_string(ED25519_SIGNATURE_SIZE) +
                         " bytes, got " + std::to_string(bytes->size()));
  }

  Signature signature;
  signature.suite = *suite;
  signature.bytes = std::move(*bytes);
  return signature;
}

std::string Signature::to_string() const {
  return std::string(suite_to_string(suite)) + ":" + encode_base64url(bytes);
}

//==============================================
// DID:KEY RESOLUTION
//==============================================

DidKey DidKey::resolve(const std::string& did) {
  const std::string prefix(PREFIX);
  if (did.compare(0, prefix.size(), prefix) != 0) {
    throw DidResolutionError("'" + did + "' is not a base58btc did:key");
  }

  auto decoded = decode_base58btc(did.substr(prefix.size()));
  if (!decoded) {
    throw DidResolutionError("'" + did + "' has an invalid base58btc body");
  }
  if (decoded->size() != sizeof(MULTICODEC_ED25519_PUB) + PublicKey().size() ||
      (*decoded)[0] != MULTICODEC_ED25519_PUB[0] || (*decoded)[1] != MULTICODEC_ED25519_PUB[1]) {
    throw DidResolutionError("'" + did + "' is not an Ed25519 public key");
  }

  PublicKey key;
  std::copy(decoded->begin() + sizeof(MULTICODEC_ED25519_PUB), decoded->end(), key.begin());
  return DidKey(did, key);
}

DidKey DidKey::from_public_key(const PublicKey& key) {
  std::vector<uint8_t> bytes(std::begin(MULTICODEC_ED25519_PUB), std::end(MULTICODEC_ED25519_PUB));
  bytes.insert(bytes.end(), key.begin(), key.end());
  return DidKey(std::string(PREFIX) + encode_base58btc(bytes), key);
}

//==============================================
// VERIFICATION
//==============================================

bool verify(const Signature& signature, const PublicKey& key, const std::string& message) {
  if (signature.suite != SignatureSuite::Ed25519 ||
      signature.bytes.size() != ED25519_SIGNATURE_SIZE) {
    BOOST_LOG_TRIVIAL(debug) << "Signature: Unsupported signature shape";
    return false;
  }

  KeyHandle pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, key.data(), key.size()));
  SignContext context;

  if (EVP_DigestVerifyInit(context.ctx, nullptr, nullptr, nullptr, pkey.key) != 1) {
    throw CryptoError("Signature: Failed to initialize verification");
  }

  int result = EVP_DigestVerify(context.ctx, signature.bytes.data(), signature.bytes.size(),
                                reinterpret_cast<const unsigned char*>(message.data()),
                                message.size());
  BOOST_LOG_TRIVIAL(debug) << "Signature: Verification " << (result == 1 ? "succeeded" : "failed");
  return result == 1;
}

//==============================================
// SIGNING
//==============================================

Ed25519Signer Ed25519Signer::generate() {
  std::vector<uint8_t> seed(SEED_SIZE);
  if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
    throw CryptoError("Signature: Failed to generate random seed");
  }
  return from_seed(seed);
}

Ed25519Signer Ed25519Signer::from_seed(const std::vector<uint8_t>& seed) {
  if (seed.size() != SEED_SIZE) {
    throw CryptoError("Signature: Invalid seed size: " + std::to_string(seed.size()) +
                      " bytes. Expected " + std::to_string(SEED_SIZE) + " bytes.");
  }

  KeyHandle pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()));

  PublicKey key;
  std::size_t key_len = key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.key, key.data(), &key_len) != 1 || key_len != key.size()) {
    throw CryptoError("Signature: Failed to derive public key");
  }

  return Ed25519Signer(seed, key);
}

Signature Ed25519Signer::sign(const std::string& message) const {
  KeyHandle pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed_.data(), seed_.size()));
  SignContext context;

  if (EVP_DigestSignInit(context.ctx, nullptr, nullptr, nullptr, pkey.key) != 1) {
    throw CryptoError("Signature: Failed to initialize signing");
  }

  Signature signature;
  signature.suite = SignatureSuite::Ed25519;
  signature.bytes.resize(ED25519_SIGNATURE_SIZE);
  std::size_t sig_len = signature.bytes.size();

  if (EVP_DigestSign(context.ctx, signature.bytes.data(), &sig_len,
                     reinterpret_cast<const unsigned char*>(message.data()), message.size()) != 1) {
    throw CryptoError("Signature: Failed to sign message");
  }
  signature.bytes.resize(sig_len);
  return signature;
}

} // namespace magenc::crypto
