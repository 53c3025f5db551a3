#ifndef MAGENC_FEDERATION_PEER_HPP
#define MAGENC_FEDERATION_PEER_HPP

#include <optional>
#include <ostream>
#include <string>
#include "network/url.hpp"

namespace magenc {
namespace federation {

// Another node, identified by its base URL and compared by origin
struct Peer {
    network::Url url;

    // Returns nullopt unless text is an absolute http(s) URL
    static std::optional<Peer> parse(const std::string& text);

    // Origin plus any path prefix, without a trailing slash
    std::string base() const;
    std::string origin() const { return url.origin(); }
    const std::string& host() const { return url.host; }

    bool operator==(const Peer& other) const { return origin() == other.origin(); }
    bool operator!=(const Peer& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const Peer& peer) {
    return os << peer.base();
}

} // namespace federation
} // namespace magenc

#endif // MAGENC_FEDERATION_PEER_HPP
