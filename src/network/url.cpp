#include "network/url.hpp"
#include <algorithm>
#include <cctype>

namespace magenc {
namespace network {

namespace {

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool is_unreserved(unsigned char c) {
  return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

} // namespace

std::optional<Url> Url::parse(const std::string& text) {
  Url url;

  auto scheme_end = text.find("://");
  if (scheme_end == std::string::npos) {
    return std::nullopt;
  }
  url.scheme = to_lower(text.substr(0, scheme_end));
  if (url.scheme != "http" && url.scheme != "https") {
    return std::nullopt;
  }

  auto start = scheme_end + 3;
  auto end = std::min({text.find('/', start), text.find('?', start), text.find('#', start),
                       text.size()});
  std::string authority = text.substr(start, end - start);

  // Credentials are not used for anything, drop them
  auto at = authority.rfind('@');
  if (at != std::string::npos) {
    authority = authority.substr(at + 1);
  }

  std::string port_text;
  if (!authority.empty() && authority[0] == '[') {
    auto close = authority.find(']');
    if (close == std::string::npos) {
      return std::nullopt;
    }
    url.host = authority.substr(1, close - 1);
    std::string rest = authority.substr(close + 1);
    if (!rest.empty()) {
      if (rest[0] != ':') {
        return std::nullopt;
      }
      port_text = rest.substr(1);
    }
  } else {
    auto colon = authority.find(':');
    url.host = authority.substr(0, colon);
    if (colon != std::string::npos) {
      port_text = authority.substr(colon + 1);
    }
  }

  if (url.host.empty() ||
      std::any_of(url.host.begin(), url.host.end(),
                  [](unsigned char c) { return std::isspace(c) || c == '%' || c == '"'; })) {
    return std::nullopt;
  }
  url.host = to_lower(url.host);

  if (port_text.empty()) {
    url.port = url.is_tls() ? 443 : 80;
  } else {
    if (port_text.size() > 5 ||
        !std::all_of(port_text.begin(), port_text.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
      return std::nullopt;
    }
    unsigned long port = std::stoul(port_text);
    if (port == 0 || port > 65535) {
      return std::nullopt;
    }
    url.port = static_cast<uint16_t>(port);
  }

  // Fragments are never sent to the server
  auto fragment = text.find('#', end);
  std::string target = text.substr(end, fragment == std::string::npos ? std::string::npos
                                                                      : fragment - end);
  if (std::any_of(target.begin(), target.end(),
                  [](unsigned char c) { return std::isspace(c) || std::iscntrl(c); })) {
    return std::nullopt;
  }
  if (target.empty() || target[0] != '/') {
    target = "/" + target;
  }
  url.target = target;

  return url;
}

bool Url::has_default_port() const {
  return (scheme == "http" && port == 80) || (scheme == "https" && port == 443);
}

std::string Url::authority() const {
  std::string host_part = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  if (has_default_port()) {
    return host_part;
  }
  return host_part + ":" + std::to_string(port);
}

std::string Url::origin() const {
  return scheme + "://" + authority();
}

std::string escape_component(const std::string& text, const std::string& safe) {
  static const char hex[] = "0123456789ABCDEF";
  std::string result;
  result.reserve(text.size());
  for (unsigned char c : text) {
    if (is_unreserved(c) || safe.find(static_cast<char>(c)) != std::string::npos) {
      result.push_back(static_cast<char>(c));
    } else {
      result.push_back('%');
      result.push_back(hex[c >> 4]);
      result.push_back(hex[c & 0x0F]);
    }
  }
  return result;
}

std::optional<std::string> unescape_component(const std::string& text) {
  std::string result;
  result.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '+') {
      result.push_back(' ');
    } else if (text[i] == '%') {
      if (i + 2 >= text.size()) {
        return std::nullopt;
      }
      int high = hex_value(text[i + 1]);
      int low = hex_value(text[i + 2]);
      if (high < 0 || low < 0) {
        return std::nullopt;
      }
      result.push_back(static_cast<char>((high << 4) | low));
      i += 2;
    } else {
      result.push_back(text[i]);
    }
  }
  return result;
}

} // namespace network
} // namespace magenc
