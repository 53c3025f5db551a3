#include "network/bootstrap.hpp"
#include <boost/log/trivial.hpp>

namespace magenc {
namespace network {

Bootstrap::Bootstrap(const config::NodeConfig& config)
    : Bootstrap(config, std::make_unique<BeastHttpClient>(config.timeout, config.max_body)) {}

Bootstrap::Bootstrap(const config::NodeConfig& config, std::unique_ptr<HttpClient> client)
    : config_(config)
    , http_client_(std::move(client)) {

    BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Initializing node with store " << config_.dir;

    try {
        // Store first (no dependencies)
        store_ = std::make_unique<store::Store>(config_.dir);
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Store created successfully";

        peer_manager_ = std::make_unique<federation::PeerManager>(build_policy());
        for (const auto& peer : collect_peers(config_.push_peers, config_.push_file)) {
            peer_manager_->add_push_peer(peer);
        }
        for (const auto& peer : collect_peers(config_.gossip_peers, config_.gossip_file)) {
            peer_manager_->add_gossip_peer(peer);
        }
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Peer Manager created with "
                                 << peer_manager_->size() << " peer(s)";

        federation::FederationOptions federation_options;
        federation_options.self_url = config_.self_url;
        federation_options.fanout = config_.fanout;
        federation_options.gossip_mode = config_.gossip_mode;
        federation_ = std::make_unique<federation::FederationEngine>(*http_client_, *peer_manager_,
                                                                     federation_options);
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Federation Engine created successfully";

        fetcher_ = std::make_unique<fetch::Fetcher>(*http_client_);

        file_server::FileServerOptions server_options;
        server_options.allow_post = config_.allow_post;
        file_server_ = std::make_unique<file_server::FileServer>(*store_, *peer_manager_, *federation_,
                                                                 *fetcher_, server_options);
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: File Server created successfully";

        // HTTP server last as it depends on all other components
        auto* file_server = file_server_.get();
        http_server_ = std::make_unique<HttpServer>(
            config_.address, config_.port, config_.threads, config_.max_body, config_.timeout,
            [file_server](const file_server::Request& request) { return file_server->handle(request); });

        BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Successfully created all components";
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Failed to initialize components: " << e.what();
        throw;
    }
}

Bootstrap::~Bootstrap() {
    if (!shutdown()) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Failed to shutdown cleanly in destructor";
    }
}

std::vector<federation::Peer> Bootstrap::collect_peers(const std::vector<std::string>& urls,
                                                       const std::string& file) {
    std::vector<federation::Peer> peers;
    for (const auto& url : urls) {
        if (auto peer = federation::Peer::parse(url)) {
            peers.push_back(*peer);
        }
    }
    if (!file.empty()) {
        for (const auto& peer : federation::PeerManager::read_peer_file(file)) {
            peers.push_back(peer);
        }
    }
    return peers;
}

federation::PeerPolicy Bootstrap::build_policy() const {
    federation::PeerPolicy policy(config_.resolve_peers ? federation::HostResolver(federation::resolve_host_addresses)
                                                        : federation::HostResolver());
    for (const auto& peer : collect_peers(config_.allow_peers, config_.allow_file)) {
        policy.allow(peer);
    }
    for (const auto& peer : collect_peers(config_.deny_peers, config_.deny_file)) {
        policy.deny(peer);
    }
    return policy;
}

bool Bootstrap::start() {
    if (!http_server_->start_listener()) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Failed to start HTTP server";
        return false;
    }
    BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Node serving on port " << http_server_->port();
    return true;
}

bool Bootstrap::shutdown() {
    try {
        BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Initiating shutdown sequence";

        // Stop taking requests before draining federation
        if (http_server_) {
            http_server_->shutdown();
        }
        if (federation_) {
            federation_->shutdown();
        }

        BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Shutdown complete";
        return true;
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Error during shutdown: " << e.what();
        return false;
    }
}

} // namespace network
} // namespace magenc
