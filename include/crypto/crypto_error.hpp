#ifndef MAGENC_CRYPTO_ERROR_HPP
#define MAGENC_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace magenc::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message) 
        : std::runtime_error(message) {}
};

class SignatureError : public CryptoError {
public:
    explicit SignatureError(const std::string& message) 
        : CryptoError("Signature error: " + message) {}
};

class DidResolutionError : public CryptoError {
public:
    explicit DidResolutionError(const std::string& message) 
        : CryptoError("DID resolution error: " + message) {}
};

} // namespace magenc::crypto

#endif // MAGENC_CRYPTO_ERROR_HPP
