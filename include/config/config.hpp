#ifndef MAGENC_CONFIG_CONFIG_HPP
#define MAGENC_CONFIG_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "federation/federation_engine.hpp"
#include "logger/logger.hpp"

namespace magenc {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message)
    : std::runtime_error("Configuration error: " + message) {}
};

// Options of the link command
struct LinkOptions {
  std::vector<std::string> cdn_bases;
  std::vector<std::string> exact_sources;
  std::optional<std::string> display_name;
  std::optional<std::string> sign_key;   // hex Ed25519 seed
};

struct NodeConfig {
  static constexpr std::size_t DEFAULT_MAX_BODY = 64 * 1024 * 1024;

  // ---- STORE AND LISTENER ----
  std::string dir{"public"};
  std::string address{"0.0.0.0"};
  uint16_t port{3000};
  std::size_t threads{1};
  bool allow_post{false};

  // ---- FEDERATION ----
  std::string self_url;
  std::vector<std::string> push_peers;
  std::vector<std::string> gossip_peers;
  std::vector<std::string> allow_peers;
  std::vector<std::string> deny_peers;
  // Line-delimited peer lists, empty when unset
  std::string push_file;
  std::string gossip_file;
  std::string allow_file;
  std::string deny_file;
  // Resolve allow and deny host names so requests match by address
  bool resolve_peers{true};
  std::size_t fanout{3};
  federation::GossipMode gossip_mode{federation::GossipMode::PUSH};

  // ---- HTTP ----
  std::chrono::milliseconds timeout{std::chrono::seconds(10)};
  std::size_t max_body{DEFAULT_MAX_BODY};

  // ---- LOGGING ----
  logger::LogOptions log;

  // ---- COMMAND LINE ----
  LinkOptions link;
  std::vector<std::string> arguments;   // positional, command first
  bool help{false};

  // Reads the command line and, when --config names one, a key = value
  // file. Command line values win. Throws ConfigError.
  static NodeConfig parse(int argc, const char* const argv[]);
  static std::string usage();
};

// Splits "host:port" or "[v6]:port". Throws ConfigError.
std::pair<std::string, uint16_t> parse_listen_address(const std::string& text);

} // namespace config
} // namespace magenc

#endif // MAGENC_CONFIG_CONFIG_HPP
