#include "clinfuse/hashing.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <stdexcept>

namespace clinfuse {

std::string sha256_hex(const std::string& data, int hex_length) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digest_length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    static const char kHex[] = "0123456789abcdef";
    std::string output;
    output.reserve(digest_length * 2);
    for (unsigned int i = 0; i < digest_length; ++i) {
        output.push_back(kHex[digest[i] >> 4]);
        output.push_back(kHex[digest[i] & 0x0f]);
    }
    const auto length = static_cast<size_t>(std::clamp(hex_length, 0, static_cast<int>(output.size())));
    return output.substr(0, length);
}

}  // namespace clinfuse
