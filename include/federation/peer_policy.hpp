#ifndef MAGENC_FEDERATION_PEER_POLICY_HPP
#define MAGENC_FEDERATION_PEER_POLICY_HPP

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "federation/peer.hpp"

namespace magenc {
namespace federation {

enum class PeerStatus {
    ALLOWED,
    DENIED,
    UNLISTED
};

const char* peer_status_to_string(PeerStatus status);

// Addresses a host name refers to. Empty when it cannot be resolved.
using HostResolver = std::function<std::vector<std::string>(const std::string& host)>;

// Resolves through the system resolver with Boost.Asio
std::vector<std::string> resolve_host_addresses(const std::string& host);

// Operator allow and deny lists. Deny always wins; once an allow entry
// exists only listed peers are federated with. Requests are matched by socket
// address, so list entries given by name are resolved when they are added.
class PeerPolicy {
public:
    // ---- CONSTRUCTOR ----
    // Without a resolver, host names only match literally
    explicit PeerPolicy(HostResolver resolver = HostResolver()) : resolver_(std::move(resolver)) {}


    // ---- LIST MANAGEMENT ----
    void allow(const Peer& peer);
    void deny(const Peer& peer);
    bool has_allow_list() const { return !allowed_origins_.empty(); }


    // ---- CLASSIFICATION ----
    PeerStatus classify(const Peer& peer) const;
    // Whether peer may be pushed to or gossiped with
    bool admits(const Peer& peer) const;

    // Admission of an incoming request. declared is the sender's own base
    // URL (X-Magenc-Peer), remote_host the socket address. peer_request is
    // true for pushes and announcements, which the allow list restricts.
    // Returns the reason for rejection, or nullopt when admitted.
    std::optional<std::string> reject_reason(const std::optional<Peer>& declared,
                                             const std::string& remote_host,
                                             bool peer_request) const;

private:
    // The host of peer plus every address it resolves to
    std::vector<std::string> host_addresses(const Peer& peer) const;

    HostResolver resolver_;
    std::set<std::string> allowed_origins_;
    std::set<std::string> allowed_hosts_;
    std::set<std::string> denied_origins_;
    std::set<std::string> denied_hosts_;
};

} // namespace federation
} // namespace magenc

#endif // MAGENC_FEDERATION_PEER_POLICY_HPP
