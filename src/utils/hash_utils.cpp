/**
 * @file hash_utils.cpp
 * @brief SHA-256 digests via OpenSSL EVP
 * 
 * Thread-safe: each call owns its own digest context.
 * 
 * @date 2025
 */

#include "runcage/utils/hash_utils.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace runcage {
namespace utils {

namespace {

std::string BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // anonymous namespace

std::string HashUtils::Sha256Hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &digest_length,
                   EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }

    return BinaryToHex(digest, digest_length);
}

} // namespace utils
} // namespace runcage
