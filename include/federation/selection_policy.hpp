#ifndef MAGENC_FEDERATION_SELECTION_POLICY_HPP
#define MAGENC_FEDERATION_SELECTION_POLICY_HPP

#include <cstddef>
#include <random>
#include <string>
#include <variant>
#include <vector>
#include "federation/peer.hpp"

namespace magenc {
namespace federation {

// Every peer in the set
struct AllPeers {};

// Uniformly random subset of n peers, or all of them when fewer exist
struct RandomSubset {
    std::size_t n;
};

using SelectionPolicy = std::variant<AllPeers, RandomSubset>;

std::vector<Peer> select_peers(const std::vector<Peer>& peers, const SelectionPolicy& policy,
                               std::mt19937& rng);

std::string describe(const SelectionPolicy& policy);

} // namespace federation
} // namespace magenc

#endif // MAGENC_FEDERATION_SELECTION_POLICY_HPP
