#ifndef MAGENC_CID_BASE32_HPP
#define MAGENC_CID_BASE32_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace magenc {
namespace cid {

// RFC 4648 base32 with the lowercase alphabet and no padding
std::string encode_base32(const std::vector<uint8_t>& bytes);

// Strict inverse of encode_base32. Returns nullopt on characters outside the
// lowercase alphabet, on impossible lengths, and on non-zero trailing bits.
std::optional<std::vector<uint8_t>> decode_base32(const std::string& text);

} // namespace cid
} // namespace magenc

#endif // MAGENC_CID_BASE32_HPP
