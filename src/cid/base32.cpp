#include "cid/base32.hpp"

namespace magenc {
namespace cid {

namespace {

const char kLowerBase32Alphabet[] = "abcdefghijklmnopqrstuvwxyz234567";

int decode_char(char c) {
  if (c >= 'a' && c <= 'z') {
    return c - 'a';
  }
  if (c >= '2' && c <= '7') {
    return c - '2' + 26;
  }
  return -1;
}

} // namespace

std::string encode_base32(const std::vector<uint8_t>& bytes) {
  std::string result;
  result.reserve((bytes.size() * 8 + 4) / 5);

  uint32_t buffer = 0;
  int bits = 0;

  for (uint8_t byte : bytes) {
    buffer = (buffer << 8) | byte;
    bits += 8;
    while (bits >= 5) {
      result.push_back(kLowerBase32Alphabet[(buffer >> (bits - 5)) & 0x1F]);
      bits -= 5;
    }
  }

  // Final partial group is left-aligned and zero filled
  if (bits > 0) {
    result.push_back(kLowerBase32Alphabet[(buffer << (5 - bits)) & 0x1F]);
  }

  return result;
}

std::optional<std::vector<uint8_t>> decode_base32(const std::string& text) {
  // A trailing group of 1, 3 or 6 characters cannot come from whole bytes
  switch (text.size() % 8) {
    case 1:
    case 3:
    case 6:
      return std::nullopt;
    default:
      break;
  }

  std::vector<uint8_t> result;
  result.reserve(text.size() * 5 / 8);

  uint32_t buffer = 0;
  int bits = 0;

  for (char c : text) {
    int value = decode_char(c);
    if (value < 0) {
      return std::nullopt;
    }
    buffer = (buffer << 5) | static_cast<uint32_t>(value);
    bits += 5;
    if (bits >= 8) {
      result.push_back(static_cast<uint8_t>((buffer >> (bits - 8)) & 0xFF));
      bits -= 8;
    }
  }

  // Leftover padding bits must be zero for the encoding to be canonical
  if ((buffer & ((1u << bits) - 1)) != 0) {
    return std::nullopt;
  }

  return result;
}

} // namespace cid
} // namespace magenc
