#ifndef MAGENC_NETWORK_URL_HPP
#define MAGENC_NETWORK_URL_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace magenc {
namespace network {

// Absolute http(s) URL split into the parts a request needs
struct Url {
  std::string scheme;   // "http" or "https", lowercase
  std::string host;     // lowercase, IPv6 without brackets
  uint16_t port{0};     // explicit or scheme default
  std::string target;   // path and query, at least "/"

  // Returns nullopt unless the text is an absolute http or https URL with a host
  static std::optional<Url> parse(const std::string& text);

  bool is_tls() const { return scheme == "https"; }
  bool has_default_port() const;

  // "scheme://host[:port]" with the port omitted when it is the default
  std::string origin() const;
  // Host header value
  std::string authority() const;
  std::string to_string() const { return origin() + target; }
};

// Percent-encodes everything outside the RFC 3986 unreserved set and the
// characters listed in safe
std::string escape_component(const std::string& text, const std::string& safe = "");

// Decodes %XX sequences and '+' as space. Returns nullopt on a truncated or
// non-hex escape.
std::optional<std::string> unescape_component(const std::string& text);

} // namespace network
} // namespace magenc

#endif // MAGENC_NETWORK_URL_HPP
