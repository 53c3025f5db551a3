#include "federation/peer.hpp"

namespace magenc {
namespace federation {

std::optional<Peer> Peer::parse(const std::string& text) {
    auto url = network::Url::parse(text);
    if (!url) {
        return std::nullopt;
    }
    return Peer{*url};
}

std::string Peer::base() const {
    std::string path = url.target;
    const auto query = path.find('?');
    if (query != std::string::npos) {
        path.erase(query);
    }
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    return url.origin() + path;
}

} // namespace federation
} // namespace magenc
