#include "config/config.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <thread>
#include <boost/log/trivial.hpp>
#include <boost/program_options.hpp>
#include "federation/federation_error.hpp"
#include "federation/peer.hpp"

namespace magenc {
namespace config {

namespace po = boost::program_options;

namespace {

// Raw values that need conversion after parsing
struct RawOptions {
  std::string config_file;
  std::string addr;
  std::size_t threads{0};
  std::string gossip_mode;
  unsigned timeout_seconds{10};
  std::string log_level;
  std::string display_name;
  std::string sign_key;
  bool no_resolve{false};
};

po::options_description describe(NodeConfig& config, RawOptions& raw) {
  po::options_description desc("magenc options");
  auto option{desc.add_options()};
  option("help,h", "print usage message");
  option("config,c", po::value(&raw.config_file), "read key = value options from file");
  option("dir,d", po::value(&config.dir)->default_value("public"), "content store root");
  option("addr,a", po::value(&raw.addr)->default_value("0.0.0.0:3000"), "listen address host:port");
  option("threads", po::value(&raw.threads)->default_value(0), "server IO threads, 0 for hardware concurrency");
  option("post", po::bool_switch(&config.allow_post), "accept POST uploads and announcements");
  option("log-level", po::value(&raw.log_level)->default_value("info"),
         "log level, [trace,debug,info,warning,error,fatal]");
  option("log-file", po::value(&config.log.log_file), "also log to a rotating file");

  po::options_description federation_desc("Federation options");
  auto federation_option{federation_desc.add_options()};
  federation_option("self", po::value(&config.self_url), "public base URL of this node, sent to peers");
  federation_option("push", po::value(&config.push_peers)->composing(), "store-and-forward peer URL");
  federation_option("gossip", po::value(&config.gossip_peers)->composing(), "gossip peer URL");
  federation_option("allow", po::value(&config.allow_peers)->composing(), "allowed peer URL");
  federation_option("deny", po::value(&config.deny_peers)->composing(), "denied peer URL");
  federation_option("push-file", po::value(&config.push_file), "line-delimited push peer URLs");
  federation_option("gossip-file", po::value(&config.gossip_file), "line-delimited gossip peer URLs");
  federation_option("allow-file", po::value(&config.allow_file), "line-delimited allowed peer URLs");
  federation_option("deny-file", po::value(&config.deny_file), "line-delimited denied peer URLs");
  federation_option("no-resolve", po::bool_switch(&raw.no_resolve),
                    "match allow and deny host names literally instead of by address");
  federation_option("fanout", po::value(&config.fanout)->default_value(3), "gossip fan-out size");
  federation_option("gossip-mode", po::value(&raw.gossip_mode)->default_value("push"),
                    "gossip by [push,announce]");
  desc.add(federation_desc);

  po::options_description http_desc("HTTP options");
  auto http_option{http_desc.add_options()};
  http_option("timeout", po::value(&raw.timeout_seconds)->default_value(10), "per-request timeout, seconds");
  http_option("max-body", po::value(&config.max_body)->default_value(NodeConfig::DEFAULT_MAX_BODY),
              "largest accepted or fetched body, bytes");
  desc.add(http_desc);

  po::options_description link_desc("Link options");
  auto link_option{link_desc.add_options()};
  link_option("cdn", po::value(&config.link.cdn_bases)->composing(), "CDN base URL to list");
  link_option("xs", po::value(&config.link.exact_sources)->composing(), "exact source URL to list");
  link_option("dn", po::value(&raw.display_name), "display name");
  link_option("sign-key", po::value(&raw.sign_key), "hex Ed25519 seed to sign the link with");
  desc.add(link_desc);

  return desc;
}

void check_peer_urls(const std::string& option, const std::vector<std::string>& urls) {
  for (const auto& url : urls) {
    if (!federation::Peer::parse(url)) {
      throw ConfigError("--" + option + ": not an http(s) URL: " + url);
    }
  }
}

} // namespace

std::pair<std::string, uint16_t> parse_listen_address(const std::string& text) {
  std::string host;
  std::string port;
  if (!text.empty() && text.front() == '[') {
    const auto close = text.find(']');
    if (close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':') {
      throw ConfigError("bad listen address: " + text);
    }
    host = text.substr(1, close - 1);
    port = text.substr(close + 2);
  } else {
    const auto colon = text.rfind(':');
    if (colon == std::string::npos) {
      throw ConfigError("listen address needs host:port: " + text);
    }
    host = text.substr(0, colon);
    port = text.substr(colon + 1);
  }

  if (host.empty() || port.empty() || port.find_first_not_of("0123456789") != std::string::npos
      || port.size() > 5 || std::stoul(port) > 65535) {
    throw ConfigError("bad listen address: " + text);
  }
  return {host, static_cast<uint16_t>(std::stoul(port))};
}

NodeConfig NodeConfig::parse(int argc, const char* const argv[]) {
  NodeConfig config;
  RawOptions raw;
  auto desc = describe(config, raw);

  po::options_description hidden;
  hidden.add_options()("arguments", po::value(&config.arguments)->composing());
  po::options_description all;
  all.add(desc).add(hidden);
  po::positional_options_description positional;
  positional.add("arguments", -1);

  try {
    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
    if (vm.count("config")) {
      const std::string path = vm["config"].as<std::string>();
      std::ifstream file(path);
      if (!file) {
        throw ConfigError("cannot open config file " + path);
      }
      po::store(po::parse_config_file(file, desc), vm);
    }
    po::notify(vm);
    config.help = vm.count("help") != 0;
  } catch (const po::error& e) {
    throw ConfigError(e.what());
  }

  const auto [host, port] = parse_listen_address(raw.addr);
  config.address = host;
  config.port = port;

  config.resolve_peers = !raw.no_resolve;
  config.threads = raw.threads > 0 ? raw.threads : std::max(1u, std::thread::hardware_concurrency());

  try {
    config.gossip_mode = federation::gossip_mode_from_string(raw.gossip_mode);
  } catch (const federation::FederationError& e) {
    throw ConfigError(e.what());
  }

  if (raw.timeout_seconds == 0) {
    throw ConfigError("--timeout must be positive");
  }
  config.timeout = std::chrono::seconds(raw.timeout_seconds);
  if (config.max_body == 0) {
    throw ConfigError("--max-body must be positive");
  }

  try {
    config.log.min_level = logger::parse_severity(raw.log_level);
  } catch (const std::invalid_argument& e) {
    throw ConfigError(e.what());
  }

  if (!config.self_url.empty() && !federation::Peer::parse(config.self_url)) {
    throw ConfigError("--self: not an http(s) URL: " + config.self_url);
  }
  check_peer_urls("push", config.push_peers);
  check_peer_urls("gossip", config.gossip_peers);
  check_peer_urls("allow", config.allow_peers);
  check_peer_urls("deny", config.deny_peers);

  if (!raw.display_name.empty()) {
    config.link.display_name = raw.display_name;
  }
  if (!raw.sign_key.empty()) {
    config.link.sign_key = raw.sign_key;
  }

  BOOST_LOG_TRIVIAL(debug) << "Config: Store " << config.dir << ", listen " << config.address << ":"
                           << config.port << ", " << config.threads << " thread(s)";
  return config;
}

std::string NodeConfig::usage() {
  NodeConfig config;
  RawOptions raw;
  std::stringstream ss;
  ss << "Usage:\n"
     << "  magenc serve [options]\n"
     << "  magenc get <magnet or web+rasl link>\n"
     << "  magenc add <file|->\n"
     << "  magenc link <file> [--cdn URL]... [--xs URL]... [--dn NAME] [--sign-key HEXSEED]\n\n"
     << describe(config, raw);
  return ss.str();
}

} // namespace config
} // namespace magenc
