/**
 * @file hash_utils.hpp
 * @brief Content digests for submitted code
 * 
 * SHA-256 digests identify submitted snippets in the execution ledger without
 * retaining the code itself.
 * 
 * @date 2025
 */

#pragma once

#include <string>

namespace runcage {
namespace utils {

class HashUtils {
public:
    /**
     * @brief Compute SHA-256 of a byte string
     * @param data Input bytes
     * @return Lowercase hex digest (64 characters)
     * 
     * @throws std::runtime_error if the OpenSSL digest call fails
     */
    static std::string Sha256Hex(const std::string& data);
};

} // namespace utils
} // namespace runcage
