#include "crypto/encoding.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>

namespace magenc::crypto {

namespace {

const char kBase58Alphabet[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

bool is_base64url_char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
         c == '-' || c == '_';
}

int base58_value(char c) {
  const char* pos = std::find(kBase58Alphabet, kBase58Alphabet + 58, c);
  if (pos == kBase58Alphabet + 58) {
    return -1;
  }
  return static_cast<int>(pos - kBase58Alphabet);
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

//==============================================
// BASE64URL
//==============================================

std::string encode_base64url(const std::vector<uint8_t>& bytes) {
  if (bytes.empty()) {
    return {};
  }

  std::string encoded(4 * ((bytes.size() + 2) / 3), '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]),
                                bytes.data(), static_cast<int>(bytes.size()));
  encoded.resize(static_cast<std::size_t>(written));

  // Translate to the URL safe alphabet and drop padding
  while (!encoded.empty() && encoded.back() == '=') {
    encoded.pop_back();
  }
  std::replace(encoded.begin(), encoded.end(), '+', '-');
  std::replace(encoded.begin(), encoded.end(), '/', '_');
  return encoded;
}

std::optional<std::vector<uint8_t>> decode_base64url(const std::string& text) {
  std::string body = text;
  while (!body.empty() && body.back() == '=') {
    body.pop_back();
  }
  if (text.size() - body.size() > 2) {
    return std::nullopt;
  }
  if (!std::all_of(body.begin(), body.end(), is_base64url_char)) {
    return std::nullopt;
  }
  if (body.size() % 4 == 1) {
    return std::nullopt;
  }
  if (body.empty()) {
    return std::vector<uint8_t>{};
  }

  std::replace(body.begin(), body.end(), '-', '+');
  std::replace(body.begin(), body.end(), '_', '/');
  std::size_t padding = (4 - body.size() % 4) % 4;
  body.append(padding, '=');

  std::vector<uint8_t> decoded(body.size() / 4 * 3);
  int written = EVP_DecodeBlock(decoded.data(),
                                reinterpret_cast<const unsigned char*>(body.data()),
                                static_cast<int>(body.size()));
  if (written < 0) {
    return std::nullopt;
  }

  // EVP_DecodeBlock counts the padding as zero bytes
  decoded.resize(static_cast<std::size_t>(written) - padding);
  return decoded;
}

//==============================================
// BASE58BTC
//==============================================

std::string encode_base58btc(const std::vector<uint8_t>& bytes) {
  std::size_t zeros = 0;
  while (zeros < bytes.size() && bytes[zeros] == 0) {
    ++zeros;
  }

  // Repeated division of the big-endian number by 58
  std::vector<uint8_t> digits;
  for (std::size_t i = zeros; i < bytes.size(); ++i) {
    int carry = bytes[i];
    for (auto& digit : digits) {
      carry += digit * 256;
      digit = static_cast<uint8_t>(carry % 58);
      carry /= 58;
    }
    while (carry > 0) {
      digits.push_back(static_cast<uint8_t>(carry % 58));
      carry /= 58;
    }
  }

  std::string result(zeros, '1');
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    result.push_back(kBase58Alphabet[*it]);
  }
  return result;
}

std::optional<std::vector<uint8_t>> decode_base58btc(const std::string& text) {
  std::size_t zeros = 0;
  while (zeros < text.size() && text[zeros] == '1') {
    ++zeros;
  }

  std::vector<uint8_t> bytes;
  for (std::size_t i = zeros; i < text.size(); ++i) {
    int carry = base58_value(text[i]);
    if (carry < 0) {
      return std::nullopt;
    }
    for (auto& byte : bytes) {
      carry += byte * 58;
      byte = static_cast<uint8_t>(carry & 0xFF);
      carry >>= 8;
    }
    while (carry > 0) {
      bytes.push_back(static_cast<uint8_t>(carry & 0xFF));
      carry >>= 8;
    }
  }

  std::vector<uint8_t> result(zeros, 0);
  result.insert(result.end(), bytes.rbegin(), bytes.rend());
  return result;
}

//==============================================
// HEX
//==============================================

std::string to_hex(const std::vector<uint8_t>& bytes) {
  std::stringstream ss;
  for (uint8_t byte : bytes) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

std::optional<std::vector<uint8_t>> from_hex(const std::string& text) {
  if (text.size() % 2 != 0) {
    return std::nullopt;
  }

  std::vector<uint8_t> bytes;
  bytes.reserve(text.size() / 2);
  for (std::size_t i = 0; i < text.size(); i += 2) {
    int high = hex_value(text[i]);
    int low = hex_value(text[i + 1]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    bytes.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  return bytes;
}

} // namespace magenc::crypto
