#include "federation/peer_policy.hpp"
#include <algorithm>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/log/trivial.hpp>

namespace magenc {
namespace federation {

namespace {

bool is_address_literal(const std::string& host) {
    boost::system::error_code ec;
    boost::asio::ip::make_address(host, ec);
    return !ec;
}

// Sockets on a dual-stack listener report IPv4 peers as ::ffff:a.b.c.d
std::string plain_address(const std::string& remote_host) {
    boost::system::error_code ec;
    const auto address = boost::asio::ip::make_address(remote_host, ec);
    if (!ec && address.is_v6() && address.to_v6().is_v4_mapped()) {
        return boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, address.to_v6()).to_string();
    }
    return remote_host;
}

} // namespace

std::vector<std::string> resolve_host_addresses(const std::string& host) {
    std::vector<std::string> addresses;
    boost::asio::io_context context;
    boost::asio::ip::tcp::resolver resolver(context);
    boost::system::error_code ec;
    const auto results = resolver.resolve(host, "", ec);
    if (ec) {
        BOOST_LOG_TRIVIAL(warning) << "Peer policy: Cannot resolve " << host << ": " << ec.message();
        return addresses;
    }
    for (const auto& entry : results) {
        const std::string address = entry.endpoint().address().to_string();
        if (std::find(addresses.begin(), addresses.end(), address) == addresses.end()) {
            addresses.push_back(address);
        }
    }
    return addresses;
}

const char* peer_status_to_string(PeerStatus status) {
    switch (status) {
        case PeerStatus::ALLOWED: return "allowed";
        case PeerStatus::DENIED: return "denied";
        case PeerStatus::UNLISTED: return "unlisted";
        default: return "unknown";
    }
}

//==============================================
// LIST MANAGEMENT
//==============================================

void PeerPolicy::allow(const Peer& peer) {
    allowed_origins_.insert(peer.origin());
    for (const auto& address : host_addresses(peer)) {
        allowed_hosts_.insert(address);
    }
    BOOST_LOG_TRIVIAL(debug) << "Peer policy: Allowing " << peer.origin();
}

void PeerPolicy::deny(const Peer& peer) {
    denied_origins_.insert(peer.origin());
    for (const auto& address : host_addresses(peer)) {
        denied_hosts_.insert(address);
    }
    BOOST_LOG_TRIVIAL(debug) << "Peer policy: Denying " << peer.origin();
}

std::vector<std::string> PeerPolicy::host_addresses(const Peer& peer) const {
    std::vector<std::string> addresses{peer.host()};
    if (!resolver_ || is_address_literal(peer.host())) {
        return addresses;
    }
    for (const auto& address : resolver_(peer.host())) {
        addresses.push_back(plain_address(address));
        BOOST_LOG_TRIVIAL(debug) << "Peer policy: " << peer.host() << " resolves to " << address;
    }
    return addresses;
}


//==============================================
// CLASSIFICATION
//==============================================

PeerStatus PeerPolicy::classify(const Peer& peer) const {
    if (denied_origins_.count(peer.origin())) {
        return PeerStatus::DENIED;
    }
    if (allowed_origins_.count(peer.origin())) {
        return PeerStatus::ALLOWED;
    }
    return PeerStatus::UNLISTED;
}

bool PeerPolicy::admits(const Peer& peer) const {
    switch (classify(peer)) {
        case PeerStatus::DENIED: return false;
        case PeerStatus::ALLOWED: return true;
        case PeerStatus::UNLISTED: return !has_allow_list();
    }
    return false;
}

std::optional<std::string> PeerPolicy::reject_reason(const std::optional<Peer>& declared,
                                                     const std::string& remote_host,
                                                     bool peer_request) const {
    if (declared && classify(*declared) == PeerStatus::DENIED) {
        return "origin " + declared->origin() + " is denied";
    }
    const std::string remote_address = plain_address(remote_host);
    if (denied_hosts_.count(remote_address)) {
        return "host " + remote_address + " is denied";
    }
    if (!peer_request || !has_allow_list()) {
        return std::nullopt;
    }
    if (declared && classify(*declared) == PeerStatus::ALLOWED) {
        return std::nullopt;
    }
    if (allowed_hosts_.count(remote_address)) {
        return std::nullopt;
    }
    return "not on the allow list";
}

} // namespace federation
} // namespace magenc
