#ifndef MAGENC_FEDERATION_ERROR_HPP
#define MAGENC_FEDERATION_ERROR_HPP

#include <stdexcept>
#include <string>

namespace magenc::federation {

class FederationError : public std::runtime_error {
public:
    explicit FederationError(const std::string& message)
        : std::runtime_error(message) {}
};

// A push or announcement came from a peer the policy does not admit
class PeerRejected : public FederationError {
public:
    PeerRejected(const std::string& peer, const std::string& reason)
        : FederationError("Peer rejected: " + peer + ": " + reason)
        , peer_(peer) {}

    const std::string& peer() const { return peer_; }

private:
    std::string peer_;
};

} // namespace magenc::federation

#endif // MAGENC_FEDERATION_ERROR_HPP
