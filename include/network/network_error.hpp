#ifndef MAGENC_NETWORK_ERROR_HPP
#define MAGENC_NETWORK_ERROR_HPP

namespace magenc {
namespace network {

enum class NetworkError {
    SUCCESS = 0,
    INVALID_URL,
    RESOLVE_FAILED,
    CONNECTION_FAILED,
    TLS_HANDSHAKE_FAILED,
    TIMEOUT,
    TRANSFER_FAILED,
    BODY_TOO_LARGE,
    TOO_MANY_REDIRECTS,
    UNKNOWN_ERROR
};

inline const char* network_error_to_string(NetworkError error) {
    switch (error) {
        case NetworkError::SUCCESS: return "Success";
        case NetworkError::INVALID_URL: return "Invalid URL";
        case NetworkError::RESOLVE_FAILED: return "Name resolution failed";
        case NetworkError::CONNECTION_FAILED: return "Connection failed";
        case NetworkError::TLS_HANDSHAKE_FAILED: return "TLS handshake failed";
        case NetworkError::TIMEOUT: return "Timeout";
        case NetworkError::TRANSFER_FAILED: return "Transfer failed";
        case NetworkError::BODY_TOO_LARGE: return "Body too large";
        case NetworkError::TOO_MANY_REDIRECTS: return "Too many redirects";
        case NetworkError::UNKNOWN_ERROR: return "Unknown error";
        default: return "Undefined error";
    }
}

} // namespace network
} // namespace magenc

#endif // MAGENC_NETWORK_ERROR_HPP
