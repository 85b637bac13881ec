#ifndef CLINFUSE_HASHING_HPP
#define CLINFUSE_HASHING_HPP

#include <string>

namespace clinfuse {

// Lower-case hex SHA-256 of `data`, truncated to `hex_length` characters
// (at most 64).
std::string sha256_hex(const std::string& data, int hex_length = 64);

}  // namespace clinfuse

#endif  // CLINFUSE_HASHING_HPP
