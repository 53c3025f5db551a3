#ifndef MAGENC_CRYPTO_ENCODING_HPP
#define MAGENC_CRYPTO_ENCODING_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace magenc::crypto {

// RFC 4648 section 5, unpadded on output, padding optional on input
std::string encode_base64url(const std::vector<uint8_t>& bytes);
std::optional<std::vector<uint8_t>> decode_base64url(const std::string& text);

// Bitcoin alphabet, as used by the multibase 'z' prefix
std::string encode_base58btc(const std::vector<uint8_t>& bytes);
std::optional<std::vector<uint8_t>> decode_base58btc(const std::string& text);

std::string to_hex(const std::vector<uint8_t>& bytes);
std::optional<std::vector<uint8_t>> from_hex(const std::string& text);

} // namespace magenc::crypto

#endif // MAGENC_CRYPTO_ENCODING_HPP
