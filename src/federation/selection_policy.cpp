#include "federation/selection_policy.hpp"
#include <algorithm>
#include <iterator>

namespace magenc {
namespace federation {

std::vector<Peer> select_peers(const std::vector<Peer>& peers, const SelectionPolicy& policy,
                               std::mt19937& rng) {
    if (std::holds_alternative<AllPeers>(policy)) {
        return peers;
    }

    const std::size_t n = std::get<RandomSubset>(policy).n;
    std::vector<Peer> selected;
    selected.reserve(std::min(n, peers.size()));
    std::sample(peers.begin(), peers.end(), std::back_inserter(selected), n, rng);
    return selected;
}

std::string describe(const SelectionPolicy& policy) {
    if (const auto* subset = std::get_if<RandomSubset>(&policy)) {
        return "random subset of " + std::to_string(subset->n);
    }
    return "all peers";
}

} // namespace federation
} // namespace magenc
