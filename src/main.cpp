#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>
#include "config/config.hpp"
#include "crypto/encoding.hpp"
#include "crypto/signature.hpp"
#include "fetch/fetcher.hpp"
#include "logger/logger.hpp"
#include "magnet/magnet_link.hpp"
#include "magnet/rasl_link.hpp"
#include "network/bootstrap.hpp"
#include "network/http_client.hpp"
#include "store/store.hpp"

namespace {

const int EXIT_USAGE = 2;

std::string read_input(const std::string& path) {
  if (path == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Cannot open " + path);
  }
  return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

int run_serve(const magenc::config::NodeConfig& config) {
  magenc::network::Bootstrap node(config);
  if (!node.start()) {
    std::cerr << "Error: Failed to start node\n";
    return 1;
  }

  // Block until SIGINT or SIGTERM
  boost::asio::io_context signals_context;
  boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
  signals.async_wait([](const boost::system::error_code&, int signal) {
    BOOST_LOG_TRIVIAL(info) << "Main: Received signal " << signal << ", stopping";
  });
  signals_context.run();

  return node.shutdown() ? 0 : 1;
}

int run_get(const magenc::config::NodeConfig& config, const std::string& link_text) {
  const auto link = magenc::magnet::parse_retrieval_link(link_text);
  magenc::network::BeastHttpClient client(config.timeout, config.max_body);
  magenc::fetch::Fetcher fetcher(client);

  try {
    const std::string bytes = fetcher.fetch(link);
    std::cout.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    std::cout.flush();
    return 0;
  } catch (const magenc::fetch::AllSourcesExhausted& e) {
    std::cerr << "Error: " << e.what() << '\n';
    for (const auto& failure : e.failures()) {
      std::cerr << "  " << failure.url << ": " << failure.reason << '\n';
    }
    return 1;
  }
}

int run_add(const magenc::config::NodeConfig& config, const std::string& path) {
  magenc::store::Store store(config.dir);
  magenc::cid::Cid cid = [&]() {
    if (path == "-") {
      return store.put(std::cin);
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
      throw std::runtime_error("Cannot open " + path);
    }
    return store.put(file);
  }();
  std::cout << cid.encode() << '\n';
  return 0;
}

int run_link(const magenc::config::NodeConfig& config, const std::string& path) {
  const std::string bytes = read_input(path);
  auto link = magenc::magnet::MagnetLink::create(bytes, config.link.cdn_bases,
                                                 config.link.exact_sources, config.link.display_name);
  if (config.link.sign_key) {
    const auto seed = magenc::crypto::from_hex(*config.link.sign_key);
    if (!seed) {
      std::cerr << "Error: --sign-key is not hex\n";
      return EXIT_USAGE;
    }
    const auto signer = magenc::crypto::Ed25519Signer::from_seed(*seed);
    link.sign(signer, bytes);
  }
  std::cout << link.serialize() << '\n';
  return 0;
}

} // namespace

int main(int argc, char* argv[]) {
  magenc::config::NodeConfig config;
  try {
    config = magenc::config::NodeConfig::parse(argc, argv);
  } catch (const magenc::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << "\n\n" << magenc::config::NodeConfig::usage();
    return EXIT_USAGE;
  }

  if (config.help || config.arguments.empty()) {
    std::cerr << magenc::config::NodeConfig::usage();
    return config.help ? 0 : EXIT_USAGE;
  }

  magenc::logger::init_logging(config.log);

  const std::string command = config.arguments.front();
  const std::vector<std::string> operands(config.arguments.begin() + 1, config.arguments.end());

  try {
    if (command == "serve" && operands.empty()) {
      return run_serve(config);
    }
    if (command == "get" && operands.size() == 1) {
      return run_get(config, operands[0]);
    }
    if (command == "add" && operands.size() == 1) {
      return run_add(config, operands[0]);
    }
    if (command == "link" && operands.size() == 1) {
      return run_link(config, operands[0]);
    }
  } catch (const magenc::magnet::MagnetError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return EXIT_USAGE;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }

  std::cerr << "Error: Unknown command or wrong arguments: " << command << "\n\n"
            << magenc::config::NodeConfig::usage();
  return EXIT_USAGE;
}
